#ifndef FIELD_EXTRACTOR_HPP
#define FIELD_EXTRACTOR_HPP

#include "configs/source_config.hpp"
#include "tracker/data_structures/data_structures.hpp"
#include "html_document.hpp"
#include <optional>
#include <string>
#include <vector>

namespace FtseTracker {
namespace Core {

enum class QuoteField {
    PRICE,
    CHANGE,
    CHANGE_PERCENT
};

enum class FieldFailureKind {
    REGION_MISSING,          // Structural: the price info region is absent
    ELEMENT_MISSING,         // Structural: a labeled field element is absent
    VALUE_NOT_NUMERIC        // Text present but not a number
};

enum class Direction {
    UP,
    DOWN,
    UNRECOGNIZED
};

struct FieldFailure {
    FieldFailureKind kind;
    std::string message;
};

struct FieldExtractionResult {
    std::optional<double> price;
    std::optional<double> change;
    std::optional<double> change_percent;
    std::vector<FieldFailure> failures;

    bool is_complete() const { return failures.empty() && price && change && change_percent; }
    bool has_structural_failure() const;
    std::string describe_failures() const;
};

/**
 * FieldExtractor - reads the three quote fields out of the index page.
 *
 * Every field is attempted independently so a failure report names all the
 * fields that could not be read, not only the first. Change and percent are
 * sign corrected from the direction markers: an explicit '-' is trusted,
 * otherwise the down glyph or a leading down class negates the value.
 */
class FieldExtractor {
public:
    explicit FieldExtractor(const MarkupConfig& markup_config);

    FieldExtractionResult try_extract(const HtmlDocument& document) const;

    // Throws PageParseError when any failure is structural, else FieldValueError
    RawQuoteFields extract(const HtmlDocument& document) const;

private:
    const MarkupConfig& markup;

    void extract_field(const HtmlElement& region, QuoteField field, FieldExtractionResult& result) const;
    const std::string& element_id_for(QuoteField field) const;
};

// Helpers shared with the tests
const char* field_display_name(QuoteField field);
std::string clean_numeric_text(const std::string& raw_text, const MarkupConfig& markup);
std::optional<double> parse_decimal(const std::string& cleaned_text);
Direction detect_direction(const std::string& raw_text, const std::string& first_class, const MarkupConfig& markup);
double apply_direction_sign(double parsed_value, const std::string& cleaned_text, Direction direction);

} // namespace Core
} // namespace FtseTracker

#endif // FIELD_EXTRACTOR_HPP
