#include "cloudreader.hpp"
#include "../errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace cloud2bim {

namespace {

std::vector<double> parseNumbers(const std::string& line)
{
    std::istringstream in(line);
    std::vector<double> values;
    double v;
    while (in >> v)
        values.push_back(v);
    if (!in.eof())
        values.clear();   // trailing garbage: treat the line as malformed
    return values;
}

bool isBlank(const std::string& line)
{
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
}

std::ifstream openOrThrow(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw IoError("Cannot read point cloud file: " + path);
    return in;
}

// Colours survive only when every kept point carries one.
void finishColours(PointCloud& cloud, size_t coloured, const std::string& path)
{
    if (coloured != cloud.points.size()) {
        if (coloured > 0)
            std::cerr << "[warn] " << path << ": only " << coloured << " of " << cloud.points.size()
                      << " points have colours, colours dropped" << std::endl;
        cloud.colours.clear();
    }
}

} // namespace

PointCloud CloudReader::readXyz(const std::string& path, int subsample)
{
    std::ifstream in = openOrThrow(path);
    const int stride = std::max(1, subsample);

    PointCloud cloud;
    std::string line;
    size_t dataLine = 0, malformed = 0, coloured = 0;
    while (std::getline(in, line)) {
        if (isBlank(line) || line[line.find_first_not_of(" \t")] == '#')
            continue;
        if (dataLine++ % stride != 0)
            continue;
        const auto v = parseNumbers(line);
        if (v.size() < 3) {
            ++malformed;
            continue;
        }
        cloud.points.emplace_back(static_cast<float>(v[0]), static_cast<float>(v[1]), static_cast<float>(v[2]));
        if (v.size() >= 6) {
            cloud.colours.emplace_back(static_cast<float>(v[3] / 255.0), static_cast<float>(v[4] / 255.0),
                                       static_cast<float>(v[5] / 255.0));
            ++coloured;
        }
    }
    if (in.bad())
        throw IoError("Error while reading point cloud file: " + path);
    if (malformed > 0)
        std::cerr << "[warn] " << path << ": skipped " << malformed << " malformed lines" << std::endl;
    finishColours(cloud, coloured, path);

    std::cout << "Loaded " << cloud.size() << " points from " << path << std::endl;
    return cloud;
}

PointCloud CloudReader::readPtx(const std::string& path, int subsample)
{
    std::ifstream in = openOrThrow(path);
    const int stride = std::max(1, subsample);

    PointCloud cloud;
    std::string line;
    size_t dataLine = 0, coloured = 0, scans = 0;

    while (true) {
        /* ---------- header -------------------------------------------------- */
        std::string colsLine;
        while (std::getline(in, colsLine) && isBlank(colsLine)) {}
        if (!in)
            break;
        std::string rowsLine;
        if (!std::getline(in, rowsLine))
            throw InputError("Truncated PTX header in " + path);
        const auto cols = parseNumbers(colsLine), rows = parseNumbers(rowsLine);
        if (cols.size() != 1 || rows.size() != 1 || cols[0] < 0 || rows[0] < 0)
            throw InputError("Malformed PTX header in " + path);
        for (int i = 0; i < 8; ++i)
            if (!std::getline(in, line))
                throw InputError("Truncated PTX header in " + path);
        ++scans;

        /* ---------- points -------------------------------------------------- */
        const size_t expected = static_cast<size_t>(cols[0]) * static_cast<size_t>(rows[0]);
        size_t read = 0;
        int extraHeader = 0;
        while (read < expected && std::getline(in, line)) {
            const auto v = parseNumbers(line);
            if (v.size() < 4) {
                if (read == 0 && extraHeader < 2) {
                    ++extraHeader;
                    continue;
                }
                throw InputError("Malformed PTX point line in " + path);
            }
            ++read;
            if (dataLine++ % stride != 0)
                continue;
            if (v[0] == 0.0 && v[1] == 0.0 && v[2] == 0.0)
                continue;
            cloud.points.emplace_back(static_cast<float>(v[0]), static_cast<float>(v[1]), static_cast<float>(v[2]));
            if (v.size() >= 7) {
                cloud.colours.emplace_back(static_cast<float>(v[4] / 255.0), static_cast<float>(v[5] / 255.0),
                                           static_cast<float>(v[6] / 255.0));
                ++coloured;
            }
        }
        if (read < expected)
            std::cerr << "[warn] " << path << ": scan " << scans << " has " << read << " of "
                      << expected << " points" << std::endl;
    }
    if (in.bad())
        throw IoError("Error while reading point cloud file: " + path);
    finishColours(cloud, coloured, path);

    std::cout << "Loaded " << cloud.size() << " points from " << scans << " scans in " << path << std::endl;
    return cloud;
}

PointCloud CloudReader::read(const std::string& path, int subsample)
{
    const auto dot = path.find_last_of('.');
    std::string ext = dot == std::string::npos ? "" : path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    if (ext == "xyz" || ext == "txt")
        return readXyz(path, subsample);
    if (ext == "ptx")
        return readPtx(path, subsample);
    throw InputError("Unsupported point cloud format '" + ext + "': " + path);
}

} // namespace cloud2bim
