#include "model.h"
#include "errors.h"

#include <algorithm>
#include <cctype>

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string difficultyToString(Difficulty d) {
    switch (d) {
        case Difficulty::Beginner:     return "beginner";
        case Difficulty::Intermediate: return "intermediate";
        case Difficulty::Advanced:     return "advanced";
        case Difficulty::Expert:       return "expert";
    }
    return "unknown";
}

std::string formatToString(DeliveryFormat f) {
    switch (f) {
        case DeliveryFormat::InPerson: return "in-person";
        case DeliveryFormat::Hybrid:   return "hybrid";
        case DeliveryFormat::Online:   return "online";
    }
    return "unknown";
}

std::string conflictTypeToString(ConflictType t) {
    switch (t) {
        case ConflictType::Direct:     return "direct";
        case ConflictType::BackToBack: return "back-to-back";
    }
    return "unknown";
}

std::string severityToString(ConflictSeverity s) {
    switch (s) {
        case ConflictSeverity::High:   return "high";
        case ConflictSeverity::Medium: return "medium";
    }
    return "unknown";
}

Difficulty parseDifficulty(const std::string& s) {
    std::string v = toLower(s);
    if (v == "beginner")     return Difficulty::Beginner;
    if (v == "intermediate") return Difficulty::Intermediate;
    if (v == "advanced")     return Difficulty::Advanced;
    if (v == "expert")       return Difficulty::Expert;
    throw InvalidInputError("unknown difficulty: '" + s + "'");
}

DeliveryFormat parseDeliveryFormat(const std::string& s) {
    std::string v = toLower(s);
    // фронт присылает и "in-person", и "in_person"
    if (v == "in-person" || v == "in_person" || v == "inperson") return DeliveryFormat::InPerson;
    if (v == "hybrid") return DeliveryFormat::Hybrid;
    if (v == "online") return DeliveryFormat::Online;
    throw InvalidInputError("unknown delivery format: '" + s + "'");
}
