// SourceConfig.hpp
#ifndef SOURCE_CONFIG_HPP
#define SOURCE_CONFIG_HPP

#include <string>

struct MarkupConfig {
    // ========================================================================
    // PRICE INFO REGION
    // ========================================================================

    std::string region_tag = "ul";                          // Element holding the three price fields
    std::string region_class = "priceinfo";                 // Class identifying the price info region

    // ========================================================================
    // LABELED FIELD ELEMENTS
    // ========================================================================

    std::string price_element_id = "Price1_lbTPrice";       // Span id of the index price
    std::string change_element_id = "Price1_lbTChange";     // Span id of the absolute change
    std::string percent_element_id = "Price1_lbTPercent";   // Span id of the percent change

    // ========================================================================
    // DIRECTION INDICATORS
    // ========================================================================

    // Local convention: red marks a rise, green marks a fall.
    std::string up_class = "clr-rd";                        // Style class of a rising value
    std::string down_class = "clr-gr";                      // Style class of a falling value
    std::string up_glyph = "▲";                             // Glyph of a rising value
    std::string down_glyph = "▼";                           // Glyph of a falling value
};

struct SourceConfig {
    // ========================================================================
    // UPSTREAM PAGE
    // ========================================================================

    std::string url = "https://histock.tw/index-tw/TWN";    // Page carrying the index quote
    std::string user_agent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36";
    int timeout_seconds = 10;                               // Upper bound of a single fetch
    bool enable_ssl_verification = true;                    // Verify the upstream certificate
    std::string live_label = "HiStock網站";                  // Provenance label of live snapshots

    // ========================================================================
    // TRACKED INDEX IDENTITY
    // ========================================================================

    std::string index_code = "TWN";
    std::string index_name = "富時台指";

    MarkupConfig markup;
};

#endif // SOURCE_CONFIG_HPP
