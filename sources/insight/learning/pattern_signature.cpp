//
// Created by gregorian on 19/10/2026.
//

#include "insight/learning/pattern_signature.h"
#include "insight/utils/hash_utils.h"
#include "insight/utils/string_utils.h"
#include <algorithm>
#include <functional>
#include <nlohmann/json.hpp>
#include <vector>

namespace insight::learning {

    namespace {

        bool has_token(const std::vector<std::string>& tokens, const std::string& token) {
            return std::ranges::find(tokens, token) != tokens.end();
        }

        std::vector<std::string> tokenize(const std::string& id) {
            std::vector<std::string> tokens;
            std::string current;
            for (const char c : id) {
                if (c == '-' || c == '_' || c == '.' || c == '/' || c == ':') {
                    if (!current.empty()) {
                        tokens.push_back(std::move(current));
                        current.clear();
                    }
                } else {
                    current.push_back(c);
                }
            }
            if (!current.empty()) {
                tokens.push_back(std::move(current));
            }
            return tokens;
        }

    }  // namespace

    std::string to_string(const DetectorFamily family) {
        switch (family) {
            case DetectorFamily::DATABASE: return "database";
            case DetectorFamily::SECURITY: return "security";
            case DetectorFamily::PERFORMANCE: return "performance";
            case DetectorFamily::RUNTIME: return "runtime";
            case DetectorFamily::ARCHITECTURE: return "architecture";
            case DetectorFamily::DEPENDENCY: return "dependency";
            case DetectorFamily::OTHER: return "other";
            default: return "unknown";
        }
    }

    DetectorFamily detector_family_from_id(const std::string& detector_id) {
        const std::string id = utils::to_lower(detector_id);
        const auto tokens = tokenize(id);
        const auto mentions = [&id](const std::initializer_list<const char*> words) {
            return std::ranges::any_of(words, [&id](const char* word) { return utils::contains(id, word); });
        };

        if (mentions({"security", "secret", "auth", "injection", "xss"})) return DetectorFamily::SECURITY;
        if (mentions({"database", "sql", "prisma"}) || has_token(tokens, "db")) return DetectorFamily::DATABASE;
        if (mentions({"performance"}) || has_token(tokens, "perf")) return DetectorFamily::PERFORMANCE;
        if (mentions({"runtime", "memory"})) return DetectorFamily::RUNTIME;
        if (mentions({"architecture", "circular", "layer"})) return DetectorFamily::ARCHITECTURE;
        if (mentions({"dependency", "package", "import"})) return DetectorFamily::DEPENDENCY;
        return DetectorFamily::OTHER;
    }

    int default_accuracy(const DetectorFamily family) {
        switch (family) {
            case DetectorFamily::DATABASE: return 85;
            case DetectorFamily::SECURITY: return 75;
            case DetectorFamily::PERFORMANCE: return 70;
            case DetectorFamily::RUNTIME: return 65;
            case DetectorFamily::ARCHITECTURE: return 70;
            case DetectorFamily::DEPENDENCY: return 70;
            default: return 75;
        }
    }

    std::size_t PatternSignatureHash::operator()(const PatternSignature& signature) const {
        std::size_t seed = std::hash<std::string>{}(signature.detector_id);
        const auto combine = [&seed](const std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        combine(std::hash<std::string>{}(signature.pattern_kind));
        combine(std::hash<std::string>{}(signature.location.file_path));
        combine(std::hash<int>{}(signature.location.line));
        return seed;
    }

    std::string generate_pattern_id(const PatternSignature& signature) {
        const std::string key = signature.detector_id + ":" + signature.pattern_kind + ":" +
                                signature.location.file_path + ":" + std::to_string(signature.location.line);
        return signature.detector_id + "-" + signature.pattern_kind + "-" + utils::compute_sha256(key).substr(0, 16);
    }

    std::string generate_signature_hash(const PatternSignature& signature) {
        nlohmann::ordered_json fields;
        fields["detector"] = signature.detector_id;
        fields["patternType"] = signature.pattern_kind;
        fields["filePath"] = signature.location.file_path;
        fields["line"] = signature.location.line;
        return utils::compute_sha256(fields.dump());
    }

}  // namespace insight::learning
