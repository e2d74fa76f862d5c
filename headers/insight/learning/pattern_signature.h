//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_PATTERN_SIGNATURE_H
#define INSIGHT_PATTERN_SIGNATURE_H

#include <cstddef>
#include <string>

namespace insight::learning {

    /**
     * Closed set of detector categories. Each one carries a default historical
     * accuracy used before any history exists for a signature.
     */
    enum class DetectorFamily {
        DATABASE,
        SECURITY,
        PERFORMANCE,
        RUNTIME,
        ARCHITECTURE,
        DEPENDENCY,
        OTHER
    };

    std::string to_string(DetectorFamily family);

    /**
     * Classify a detector id by keyword: security terms win over database terms,
     * so "sql-injection" is SECURITY.
     */
    DetectorFamily detector_family_from_id(const std::string& detector_id);

    /**
     * Prior accuracy in percent: database 85, security 75, performance 70,
     * runtime 65, architecture 70, dependency 70, anything else 75.
     */
    int default_accuracy(DetectorFamily family);

    struct FindingLocation {
        std::string file_path;
        int line = 0;

        bool operator==(const FindingLocation&) const = default;
    };

    /**
     * Identity of a recurring finding. Two signatures with equal fields are the
     * same learned pattern, in this process or any later one.
     */
    struct PatternSignature {
        std::string detector_id;
        std::string pattern_kind;
        FindingLocation location;

        [[nodiscard]] DetectorFamily family() const { return detector_family_from_id(detector_id); }

        bool operator==(const PatternSignature&) const = default;
    };

    struct PatternSignatureHash {
        std::size_t operator()(const PatternSignature& signature) const;
    };

    /**
     * "<detector>-<kind>-<first 16 hex of sha256("detector:kind:file:line")>".
     */
    std::string generate_pattern_id(const PatternSignature& signature);

    /**
     * Full SHA-256 over the compact JSON form of the signature fields.
     */
    std::string generate_signature_hash(const PatternSignature& signature);

}  // namespace insight::learning

#endif //INSIGHT_PATTERN_SIGNATURE_H
