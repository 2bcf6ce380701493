#include <panelkit/layout/grid_length.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace panelkit::layout {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

float parse_number(std::string_view token, std::string_view source) {
    std::string buffer(token);
    char* end = nullptr;
    float value = std::strtof(buffer.c_str(), &end);
    if (buffer.empty() || end != buffer.c_str() + buffer.size() || !std::isfinite(value)) {
        throw std::invalid_argument("invalid grid length '" + std::string(source) + "'");
    }
    return value;
}

} // namespace

GridLength::GridLength(float value, GridUnitType type)
    : value_(std::isnan(value) || value < 0 ? 0.0f : value), type_(type) {}

std::string GridLength::to_string() const {
    std::ostringstream oss;
    switch (type_) {
        case GridUnitType::Auto:
            return "Auto";
        case GridUnitType::Pixel:
            oss << value_;
            break;
        case GridUnitType::Star:
            if (value_ != 1.0f) oss << value_;
            oss << "*";
            break;
    }
    return oss.str();
}

GridLength parse_grid_length(std::string_view text) {
    std::string_view token = trim(text);
    if (token.empty()) {
        throw std::invalid_argument("empty grid length");
    }
    if (iequals(token, "auto")) {
        return GridLength::auto_size();
    }
    if (token.back() == '*') {
        std::string_view weight = trim(token.substr(0, token.size() - 1));
        if (weight.empty()) return GridLength::stars();
        return GridLength::stars(parse_number(weight, text));
    }
    return GridLength::pixels(parse_number(token, text));
}

std::vector<GridLength> parse_grid_lengths(std::string_view text) {
    std::vector<GridLength> result;
    while (!text.empty()) {
        size_t comma = text.find(',');
        std::string_view part = trim(text.substr(0, comma));
        if (!part.empty()) {
            result.push_back(parse_grid_length(part));
        }
        if (comma == std::string_view::npos) break;
        text.remove_prefix(comma + 1);
    }
    return result;
}

} // namespace panelkit::layout
