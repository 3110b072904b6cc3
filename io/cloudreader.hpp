#ifndef CLOUDREADER_H
#define CLOUDREADER_H

#include <string>
#include "../pointcloud/pointcloud.hpp"

namespace cloud2bim {

/**
 * @brief Text point cloud readers. subsample keeps every n-th data line.
 *
 * Unreadable files raise IoError.
 */
class CloudReader
{
public:
    /** Dispatch on the extension (.xyz, .txt, .ptx). Anything else is an InputError. */
    static PointCloud read(const std::string& path, int subsample = 1);

    /** "x y z [r g b]" per line, colours 0..255. '#' comments and blank lines skipped. */
    static PointCloud readXyz(const std::string& path, int subsample = 1);

    /**
     * Leica PTX: each scan starts with a 10-line header (columns, rows,
     * scanner position, axes, transformation), optionally followed by two
     * more short lines. Data lines are "x y z intensity [r g b]". Points at
     * the origin mark missing returns and are dropped.
     */
    static PointCloud readPtx(const std::string& path, int subsample = 1);
};

} // namespace cloud2bim

#endif // CLOUDREADER_H
