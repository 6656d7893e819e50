#include "field_extractor.hpp"
#include "tracker/data_structures/tracker_errors.hpp"
#include "logging/logs/snapshot_logs.hpp"
#include <cctype>
#include <cmath>
#include <stdexcept>

using FtseTracker::Logging::SnapshotLogs;

namespace FtseTracker {
namespace Core {

namespace {

const char* const NON_BREAKING_SPACE = "\xC2\xA0";

void remove_all(std::string& text, const std::string& token) {
    if (token.empty()) {
        return;
    }
    size_t position = text.find(token);
    while (position != std::string::npos) {
        text.erase(position, token.size());
        position = text.find(token, position);
    }
}

bool contains(const std::string& text, const std::string& token) {
    return !token.empty() && text.find(token) != std::string::npos;
}

} // anonymous namespace

const char* field_display_name(QuoteField field) {
    switch (field) {
        case QuoteField::PRICE:
            return "Price";
        case QuoteField::CHANGE:
            return "Change";
        case QuoteField::CHANGE_PERCENT:
            return "Change percent";
        default:
            return "Unknown field";
    }
}

std::string clean_numeric_text(const std::string& raw_text, const MarkupConfig& markup) {
    std::string cleaned = raw_text;
    remove_all(cleaned, markup.up_glyph);
    remove_all(cleaned, markup.down_glyph);
    remove_all(cleaned, NON_BREAKING_SPACE);

    std::string result;
    result.reserve(cleaned.size());
    for (char character : cleaned) {
        if (character == ',' || character == '%' || std::isspace(static_cast<unsigned char>(character))) {
            continue;
        }
        result.push_back(character);
    }
    return result;
}

std::optional<double> parse_decimal(const std::string& cleaned_text) {
    if (cleaned_text.empty()) {
        return std::nullopt;
    }

    // Optional sign, then digits with at most one decimal point
    size_t index = 0;
    if (cleaned_text[0] == '-' || cleaned_text[0] == '+') {
        index = 1;
    }
    bool seen_digit = false;
    bool seen_point = false;
    for (; index < cleaned_text.size(); ++index) {
        char character = cleaned_text[index];
        if (std::isdigit(static_cast<unsigned char>(character))) {
            seen_digit = true;
        } else if (character == '.' && !seen_point) {
            seen_point = true;
        } else {
            return std::nullopt;
        }
    }
    if (!seen_digit) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        double parsed_value = std::stod(cleaned_text, &consumed);
        if (consumed != cleaned_text.size() || !std::isfinite(parsed_value)) {
            return std::nullopt;
        }
        return parsed_value;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

Direction detect_direction(const std::string& raw_text, const std::string& first_class, const MarkupConfig& markup) {
    if (contains(raw_text, markup.down_glyph) || first_class == markup.down_class) {
        return Direction::DOWN;
    }
    if (contains(raw_text, markup.up_glyph) || first_class == markup.up_class) {
        return Direction::UP;
    }
    return Direction::UNRECOGNIZED;
}

double apply_direction_sign(double parsed_value, const std::string& cleaned_text, Direction direction) {
    if (!cleaned_text.empty() && cleaned_text[0] == '-') {
        return parsed_value;
    }
    if (direction == Direction::DOWN) {
        return -parsed_value;
    }
    return parsed_value;
}

bool FieldExtractionResult::has_structural_failure() const {
    for (const FieldFailure& failure : failures) {
        if (failure.kind != FieldFailureKind::VALUE_NOT_NUMERIC) {
            return true;
        }
    }
    return false;
}

std::string FieldExtractionResult::describe_failures() const {
    std::string description;
    for (const FieldFailure& failure : failures) {
        if (!description.empty()) {
            description += "; ";
        }
        description += failure.message;
    }
    return description;
}

FieldExtractor::FieldExtractor(const MarkupConfig& markup_config) : markup(markup_config) {}

const std::string& FieldExtractor::element_id_for(QuoteField field) const {
    switch (field) {
        case QuoteField::PRICE:
            return markup.price_element_id;
        case QuoteField::CHANGE:
            return markup.change_element_id;
        case QuoteField::CHANGE_PERCENT:
            return markup.percent_element_id;
        default:
            throw std::invalid_argument("Unknown quote field");
    }
}

FieldExtractionResult FieldExtractor::try_extract(const HtmlDocument& document) const {
    FieldExtractionResult result;

    std::optional<HtmlElement> region = document.find_first_with_class(markup.region_tag, markup.region_class);
    if (!region) {
        result.failures.push_back({FieldFailureKind::REGION_MISSING, "Price info region not found"});
        return result;
    }

    extract_field(*region, QuoteField::PRICE, result);
    extract_field(*region, QuoteField::CHANGE, result);
    extract_field(*region, QuoteField::CHANGE_PERCENT, result);
    return result;
}

void FieldExtractor::extract_field(const HtmlElement& region, QuoteField field, FieldExtractionResult& result) const {
    std::string field_name = field_display_name(field);

    std::optional<HtmlElement> labeled_element = region.find_descendant_with_id("span", element_id_for(field));
    if (!labeled_element) {
        result.failures.push_back({FieldFailureKind::ELEMENT_MISSING, field_name + " element not found"});
        return;
    }

    // The value sits in the first nested span carrying a direction class, if any
    std::optional<HtmlElement> styled_element = labeled_element->find_descendant([this](const HtmlElement& candidate) {
        return candidate.get_tag_name() == "span" &&
               (candidate.has_class(markup.up_class) || candidate.has_class(markup.down_class));
    });
    const HtmlElement& value_element = styled_element ? *styled_element : *labeled_element;

    std::string raw_text = value_element.get_text();
    std::string cleaned_text = clean_numeric_text(raw_text, markup);
    std::optional<double> parsed_value = parse_decimal(cleaned_text);
    if (!parsed_value) {
        result.failures.push_back({FieldFailureKind::VALUE_NOT_NUMERIC,
                                   field_name + " value is not numeric: '" + raw_text + "'"});
        return;
    }

    if (field == QuoteField::PRICE) {
        result.price = *parsed_value;
        return;
    }

    std::vector<std::string> classes = value_element.get_classes();
    std::string first_class = classes.empty() ? std::string() : classes.front();
    Direction direction = detect_direction(raw_text, first_class, markup);
    if (direction == Direction::UNRECOGNIZED) {
        SnapshotLogs::log_unrecognized_direction(field_name, raw_text, first_class);
    }

    double signed_value = apply_direction_sign(*parsed_value, cleaned_text, direction);
    if (field == QuoteField::CHANGE) {
        result.change = signed_value;
    } else {
        result.change_percent = signed_value;
    }
}

RawQuoteFields FieldExtractor::extract(const HtmlDocument& document) const {
    FieldExtractionResult result = try_extract(document);
    if (!result.failures.empty()) {
        if (result.has_structural_failure()) {
            throw PageParseError(result.describe_failures());
        }
        throw FieldValueError(result.describe_failures());
    }
    if (!result.is_complete()) {
        throw PageParseError("Quote fields incomplete");
    }
    return RawQuoteFields(*result.price, *result.change, *result.change_percent);
}

} // namespace Core
} // namespace FtseTracker
