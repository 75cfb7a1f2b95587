/**
 * @file FileIO.cpp
 * @brief Text asset I/O implementation
 */

#include <MunsellSpace/Platform/FileIO.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

// Platform-specific includes
#ifdef _WIN32
#include <io.h>
#define ACCESS _access
#else
#include <unistd.h>
#define ACCESS access
#endif

namespace MunsellSpace::Platform {

// ============================================================================
// Path Utilities
// ============================================================================

bool FileExists(const std::string& path) {
    if (path.empty()) return false;
    return ACCESS(path.c_str(), 0) == 0;
}

std::string JoinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (name.empty()) return dir;

    char lastChar = dir.back();
    if (lastChar == '/' || lastChar == '\\') {
        return dir + name;
    }

#ifdef _WIN32
    return dir + "\\" + name;
#else
    return dir + "/" + name;
#endif
}

// ============================================================================
// Text File I/O
// ============================================================================

bool ReadTextLines(const std::string& path, std::vector<std::string>& lines,
                   bool trimLines) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    lines.clear();
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(trimLines ? TrimString(line) : line);
    }

    return !file.bad();
}

bool WriteTextLines(const std::string& path, const std::vector<std::string>& lines,
                    const std::string& lineEnding) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }

    for (const auto& line : lines) {
        file << line << lineEnding;
    }

    return file.good();
}

// ============================================================================
// Tokenizing
// ============================================================================

std::string TrimString(const std::string& str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
    return str.substr(begin, end - begin);
}

std::vector<std::string> SplitString(const std::string& str, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(TrimString(str.substr(start)));
            break;
        }
        fields.push_back(TrimString(str.substr(start, pos - start)));
        start = pos + 1;
    }
    return fields;
}

std::vector<std::string> SplitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool ParseDouble(const std::string& str, double& value) {
    if (str.empty()) return false;
    const char* begin = str.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(v)) {
        return false;
    }
    value = v;
    return true;
}

bool ParseInt(const std::string& str, int& value) {
    if (str.empty()) return false;
    const char* begin = str.c_str();
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE ||
        v < static_cast<long>(INT32_MIN) || v > static_cast<long>(INT32_MAX)) {
        return false;
    }
    value = static_cast<int>(v);
    return true;
}

} // namespace MunsellSpace::Platform
