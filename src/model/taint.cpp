/**
 * @file taint.cpp
 * @brief Taint and toleration helpers.
 * @author Dimitris Kafetzis
 */

#include "model/taint.hpp"

namespace placement_engine {

Result<TaintEffect> parse_taint_effect(std::string_view text) {
    if (text.empty() || text == "NoSelect") return TaintEffect::NoSelect;
    if (text == "PreferNoSelect") return TaintEffect::PreferNoSelect;
    if (text == "NoSelectIfNew") return TaintEffect::NoSelectIfNew;
    return Error{ErrorCode::ParseError, "Unknown taint effect: " + std::string{text}};
}

Result<TolerationOperator> parse_toleration_operator(std::string_view text) {
    if (text.empty() || text == "Equal") return TolerationOperator::Equal;
    if (text == "Exists") return TolerationOperator::Exists;
    return Error{ErrorCode::ParseError, "Unknown toleration operator: " + std::string{text}};
}

std::string describe(const Taint& taint) {
    std::string out = taint.key;
    if (!taint.value.empty()) {
        out += "=";
        out += taint.value;
    }
    out += ":";
    out += to_string(taint.effect);
    return out;
}

std::string describe(const Toleration& toleration) {
    std::string out = toleration.key.empty() ? std::string{"*"} : toleration.key;
    out += " ";
    out += to_string(toleration.op);
    if (toleration.op == TolerationOperator::Equal || !toleration.value.empty()) {
        out += " \"" + toleration.value + "\"";
    }
    if (toleration.effect) {
        out += " effect=";
        out += to_string(*toleration.effect);
    }
    if (toleration.toleration_seconds) {
        out += " for " + std::to_string(*toleration.toleration_seconds) + "s";
    }
    return out;
}

}  // namespace placement_engine
