/**
 * @file PolyhedronIO.cpp
 * @brief Polyhedron text format reader / writer
 */

#include <MunsellSpace/Geometry/PolyhedronIO.h>
#include <MunsellSpace/Geometry/CartesianMapper.h>
#include <MunsellSpace/Core/Exception.h>
#include <MunsellSpace/Core/MunsellColor.h>
#include <MunsellSpace/Platform/FileIO.h>

#include <cstdio>
#include <utility>

namespace MunsellSpace::Geometry {

namespace {

std::string LineError(size_t lineNo, const std::string& what) {
    return "polyhedron line " + std::to_string(lineNo) + ": " + what;
}

struct PendingPolyhedron {
    std::string name;
    size_t sampleCount = 0;
    std::vector<Point3d> vertices;
    std::vector<TriangleFace> faces;
};

size_t ParseIndex(const std::string& token, size_t lineNo) {
    int index = 0;
    if (!Platform::ParseInt(token, index) || index < 0) {
        throw ParseException(LineError(lineNo, "invalid face index '" + token + "'"));
    }
    return static_cast<size_t>(index);
}

double ParseCoordinate(const std::string& token, size_t lineNo) {
    double v = 0.0;
    if (!Platform::ParseDouble(token, v)) {
        throw ParseException(LineError(lineNo, "invalid coordinate '" + token + "'"));
    }
    return v;
}

std::string FormatPoint(const Point3d& p) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "v %.17g %.17g %.17g", p.x, p.y, p.z);
    return buf;
}

} // anonymous namespace

std::vector<Polyhedron> ParsePolyhedra(const std::vector<std::string>& lines) {
    std::vector<Polyhedron> result;
    PendingPolyhedron pending;
    bool inBlock = false;
    size_t blockStart = 0;

    for (size_t i = 0; i < lines.size(); ++i) {
        size_t lineNo = i + 1;
        std::string line = lines[i];
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = Platform::TrimString(line);
        if (line.empty()) continue;

        auto tokens = Platform::SplitWhitespace(line);
        const std::string& keyword = tokens[0];

        if (keyword == "polyhedron") {
            if (inBlock) {
                throw ParseException(LineError(lineNo, "'polyhedron' inside an unterminated block"));
            }
            if (tokens.size() != 2 && !(tokens.size() == 4 && tokens[2] == "samples")) {
                throw ParseException(LineError(lineNo, "expected 'polyhedron <name> [samples <n>]'"));
            }
            pending = PendingPolyhedron();
            pending.name = tokens[1];
            if (tokens.size() == 4) {
                int samples = 0;
                if (!Platform::ParseInt(tokens[3], samples) || samples < 0) {
                    throw ParseException(LineError(lineNo, "invalid sample count '" + tokens[3] + "'"));
                }
                pending.sampleCount = static_cast<size_t>(samples);
            }
            inBlock = true;
            blockStart = lineNo;
            continue;
        }

        if (!inBlock) {
            throw ParseException(LineError(lineNo, "'" + keyword + "' outside a polyhedron block"));
        }

        if (keyword == "v") {
            if (tokens.size() != 4) {
                throw ParseException(LineError(lineNo, "expected 'v <x> <y> <z>'"));
            }
            pending.vertices.emplace_back(ParseCoordinate(tokens[1], lineNo),
                                          ParseCoordinate(tokens[2], lineNo),
                                          ParseCoordinate(tokens[3], lineNo));
        } else if (keyword == "m") {
            std::string notation = Platform::TrimString(line.substr(1));
            try {
                pending.vertices.push_back(ToCartesian(ParseMunsell(notation)));
            } catch (const InvalidArgumentException& e) {
                throw ParseException(LineError(lineNo, e.what()));
            }
        } else if (keyword == "f") {
            if (tokens.size() != 4) {
                throw ParseException(LineError(lineNo, "expected 'f <i> <j> <k>'"));
            }
            pending.faces.emplace_back(ParseIndex(tokens[1], lineNo),
                                       ParseIndex(tokens[2], lineNo),
                                       ParseIndex(tokens[3], lineNo));
        } else if (keyword == "end") {
            try {
                result.emplace_back(pending.name, std::move(pending.vertices),
                                    std::move(pending.faces), pending.sampleCount);
            } catch (const InvalidArgumentException& e) {
                throw ParseException(LineError(lineNo, e.what()));
            }
            inBlock = false;
        } else {
            throw ParseException(LineError(lineNo, "unknown keyword '" + keyword + "'"));
        }
    }

    if (inBlock) {
        throw ParseException(LineError(blockStart, "polyhedron '" + pending.name +
                                                   "' is missing 'end'"));
    }
    return result;
}

std::vector<Polyhedron> LoadPolyhedra(const std::string& path) {
    std::vector<std::string> lines;
    if (!Platform::ReadTextLines(path, lines)) {
        throw IOException("cannot read polyhedra '" + path + "'");
    }
    return ParsePolyhedra(lines);
}

std::vector<std::string> FormatPolyhedra(const std::vector<Polyhedron>& polyhedra) {
    std::vector<std::string> lines;
    for (const auto& poly : polyhedra) {
        std::string header = "polyhedron " + poly.Name();
        if (poly.SampleCount() > 0) {
            header += " samples " + std::to_string(poly.SampleCount());
        }
        lines.push_back(header);
        for (const auto& v : poly.Vertices()) {
            lines.push_back(FormatPoint(v));
        }
        for (const auto& f : poly.Faces()) {
            lines.push_back("f " + std::to_string(f.v0) + " " + std::to_string(f.v1) + " " +
                            std::to_string(f.v2));
        }
        lines.push_back("end");
    }
    return lines;
}

void SavePolyhedra(const std::string& path, const std::vector<Polyhedron>& polyhedra) {
    if (!Platform::WriteTextLines(path, FormatPolyhedra(polyhedra))) {
        throw IOException("cannot write polyhedra '" + path + "'");
    }
}

} // namespace MunsellSpace::Geometry
