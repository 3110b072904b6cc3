#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

namespace cloud2bim {

/** Base of every failure raised by the pipeline. */
class Cloud2BimError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** Empty or malformed cloud, invalid configuration value. */
class InputError : public Cloud2BimError
{
public:
    using Cloud2BimError::Cloud2BimError;
};

/** A detector found nothing where the job cannot continue without it. */
class DetectionError : public Cloud2BimError
{
public:
    using Cloud2BimError::Cloud2BimError;
};

/** Degenerate element geometry; callers skip the element. */
class GeometryError : public Cloud2BimError
{
public:
    using Cloud2BimError::Cloud2BimError;
};

/** Reading or writing a file failed. */
class IoError : public Cloud2BimError
{
public:
    using Cloud2BimError::Cloud2BimError;
};

} // namespace cloud2bim

#endif // ERRORS_H
