#include "session_config.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

ErrorCorrection parse_error_correction(const std::string& text) {
    std::string level = to_lower(text);
    if (level == "l") return ErrorCorrection::Low;
    if (level == "m") return ErrorCorrection::Medium;
    if (level == "h") return ErrorCorrection::High;
    throw std::invalid_argument("Invalid error correction level '" + text + "' (use L, M or H)");
}

const char* error_correction_name(ErrorCorrection level) {
    switch (level) {
        case ErrorCorrection::Low: return "L";
        case ErrorCorrection::Medium: return "M";
        case ErrorCorrection::High: return "H";
    }
    return "?";
}

PrintMedium parse_print_medium(const std::string& text) {
    std::string medium = to_lower(text);
    if (medium == "png") return PrintMedium::Png;
    if (medium == "letter") return PrintMedium::Letter;
    if (medium == "index" || medium == "index_card") return PrintMedium::IndexCard;
    if (medium == "playing_card") return PrintMedium::PlayingCard;
    throw std::invalid_argument("Invalid output medium '" + text + "'");
}

const char* print_medium_name(PrintMedium medium) {
    switch (medium) {
        case PrintMedium::Png: return "png";
        case PrintMedium::Letter: return "letter";
        case PrintMedium::IndexCard: return "index_card";
        case PrintMedium::PlayingCard: return "playing_card";
    }
    return "?";
}
