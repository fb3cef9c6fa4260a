#pragma once

#include <chrono>
#include <optional>
#include <rapidjson/document.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>
#include "../../common/errors.hpp"
#include "../../common/models.hpp"
#include "paged_query.hpp"

// Turns raw catalog responses into domain entities. Every record parser
// either returns a complete entity or throws ParseError; nothing half-filled
// leaves this layer.
namespace camper::bandcamp {

rapidjson::Document parse_json(const std::string& body, const char* what);

CatalogItem parse_search_result(const rapidjson::Value& record);
CatalogItem parse_discover_item(const rapidjson::Value& record);
LibraryEntry parse_collection_item(const rapidjson::Value& record, AcquisitionKind kind);

// Throws AuthExpired when the summary is missing, which is how the catalog
// answers an anonymous or expired cookie.
FanInfo parse_collection_summary(const rapidjson::Value& document);

// Parses a release page (album or single track). `album_url` becomes the
// Album id and every Track's album reference.
Album parse_album_page(const std::string& html, const std::string& album_url);

std::optional<std::string> extract_tralbum(const std::string& html);
std::vector<std::string> extract_tags(const std::string& html);
std::string html_unescape(const std::string& text);

// "29 Oct 2021 18:13:27 GMT"
std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text);

// Parses each element of a JSON array in isolation. A record that throws
// ParseError is logged and counted; the rest of the page survives, in order.
template <typename T, typename ParseOne>
Page<T> parse_records(const rapidjson::Value& records, const char* what, ParseOne parse_one) {
    if (!records.IsArray()) {
        throw ParseError(std::string(what) + ": expected an array of records");
    }

    Page<T> page;
    rapidjson::SizeType index = 0;
    for (const auto& record : records.GetArray()) {
        try {
            page.items.push_back(parse_one(record));
        } catch (const ParseError& e) {
            ++page.skipped;
            spdlog::warn("{}: skipping record {}: {}", what, index, e.what());
        }
        ++index;
    }
    return page;
}

} // namespace camper::bandcamp
