#include "fileio.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("readFile: cannot open " + path);
    }
    std::vector<uint8_t> data;
    try {
        // istreambuf_iterator lets filebuf errors (e.g. EISDIR) escape as
        // std::ios_base::failure.
        data.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure& e) {
        throw std::runtime_error("readFile: read failed for " + path + ": " + e.what());
    }
    if (f.bad()) {
        throw std::runtime_error("readFile: read failed for " + path);
    }
    return data;
}

void writeFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        throw std::runtime_error("writeFile: cannot open " + path);
    }
    f.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
    if (!f) {
        throw std::runtime_error("writeFile: write failed for " + path);
    }
}

static std::ifstream openForCompare(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("isSameFile: cannot open " + path);
    }
    return f;
}

// Compare two streams in 64 KiB chunks.
static bool sameContent(std::ifstream& a, std::ifstream& b) {
    constexpr size_t kChunk = 64 * 1024;
    std::vector<char> bufA(kChunk);
    std::vector<char> bufB(kChunk);

    while (true) {
        a.read(bufA.data(), static_cast<std::streamsize>(kChunk));
        b.read(bufB.data(), static_cast<std::streamsize>(kChunk));
        std::streamsize nA = a.gcount();
        std::streamsize nB = b.gcount();
        if (a.bad() || b.bad()) {
            throw std::runtime_error("isSameFile: read failed");
        }
        if (nA != nB) return false;
        if (!std::equal(bufA.begin(), bufA.begin() + nA, bufB.begin())) return false;
        if (nA < static_cast<std::streamsize>(kChunk)) return true;
    }
}

bool isSameFile(const std::vector<std::string>& paths) {
    if (paths.size() < 2) {
        return true;
    }
    for (size_t k = 1; k < paths.size(); ++k) {
        std::ifstream first = openForCompare(paths[0]);
        std::ifstream other = openForCompare(paths[k]);
        if (!sameContent(first, other)) {
            return false;
        }
    }
    return true;
}
