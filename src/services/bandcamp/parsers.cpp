#include "parsers.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>
#include "urls.hpp"

namespace camper::bandcamp {

namespace {

const rapidjson::Value* member(const rapidjson::Value& object, const char* key) {
    if (!object.IsObject()) {
        return nullptr;
    }
    auto it = object.FindMember(key);
    if (it == object.MemberEnd() || it->value.IsNull()) {
        return nullptr;
    }
    return &it->value;
}

std::optional<std::string> optional_string(const rapidjson::Value& object, const char* key) {
    const auto* value = member(object, key);
    if (value && value->IsString()) {
        return std::string(value->GetString(), value->GetStringLength());
    }
    return std::nullopt;
}

std::string require_string(const rapidjson::Value& object, const char* key) {
    auto value = optional_string(object, key);
    if (!value || value->empty()) {
        throw ParseError(std::string("missing or empty \"") + key + "\"");
    }
    return *value;
}

std::optional<std::uint64_t> optional_id(const rapidjson::Value& object, const char* key) {
    const auto* value = member(object, key);
    if (!value) {
        return std::nullopt;
    }
    if (value->IsUint64()) {
        return value->GetUint64();
    }
    if (value->IsString()) {
        try {
            return std::stoull(value->GetString());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<double> optional_number(const rapidjson::Value& object, const char* key) {
    const auto* value = member(object, key);
    if (value && value->IsNumber()) {
        return value->GetDouble();
    }
    return std::nullopt;
}

std::string art_from(const rapidjson::Value& object, const char* art_key) {
    if (auto art_id = optional_id(object, art_key)) {
        return art_url_thumb(*art_id);
    }
    return optional_string(object, "img").value_or("");
}

void append_utf8(std::string& out, unsigned long code_point) {
    // Surrogates and values past Unicode become U+FFFD.
    if ((code_point >= 0xD800 && code_point <= 0xDFFF) || code_point > 0x10FFFF) {
        code_point = 0xFFFD;
    }
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

std::string trim(const std::string& text) {
    const char* blank = " \t\r\n";
    auto start = text.find_first_not_of(blank);
    if (start == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(blank);
    return text.substr(start, end - start + 1);
}

Track parse_track_info(const rapidjson::Value& record, const Album& album, int position) {
    Track track;
    auto id = optional_id(record, "track_id");
    if (!id) {
        id = optional_id(record, "id");
    }
    if (!id) {
        throw ParseError("track without an id");
    }
    track.id = std::to_string(*id);
    track.title = require_string(record, "title");
    track.artist = optional_string(record, "artist").value_or(album.artist_name);
    track.album_id = album.id;
    track.album_title = album.title;
    track.art_url = album.art_url;

    if (auto duration = optional_number(record, "duration"); duration && *duration > 0) {
        track.duration = *duration;
    }
    if (const auto* file = member(record, "file")) {
        if (auto stream = optional_string(*file, "mp3-128")) {
            track.stream_url = *stream;
        }
    }

    const auto* number = member(record, "track_num");
    track.track_number = (number && number->IsInt()) ? number->GetInt() : position;
    return track;
}

} // namespace

rapidjson::Document parse_json(const std::string& body, const char* what) {
    rapidjson::Document document;
    document.Parse(body.c_str(), body.size());
    if (document.HasParseError()) {
        throw ParseError(std::string(what) + ": response is not valid JSON (error " +
                         std::to_string(document.GetParseError()) + " at offset " +
                         std::to_string(document.GetErrorOffset()) + ")");
    }
    if (!document.IsObject()) {
        throw ParseError(std::string(what) + ": response is not a JSON object");
    }
    return document;
}

CatalogItem parse_search_result(const rapidjson::Value& record) {
    if (!record.IsObject()) {
        throw ParseError("search result is not an object");
    }

    CatalogItem item;
    std::string type = require_string(record, "type");
    item.title = require_string(record, "name");
    item.art_url = art_from(record, "art_id");
    item.genre = optional_string(record, "genre").value_or(optional_string(record, "genre_name").value_or(""));

    if (type == "a" || type == "t") {
        item.kind = type == "a" ? EntityKind::Album : EntityKind::Track;
        item.id = require_string(record, "item_url_path");
        item.artist = optional_string(record, "band_name").value_or("");
    } else if (type == "b") {
        item.kind = EntityKind::Artist;
        item.id = require_string(record, "item_url_root");
        item.artist = item.title;
    } else {
        throw ParseError("unsupported result type \"" + type + "\"");
    }
    return item;
}

CatalogItem parse_discover_item(const rapidjson::Value& record) {
    if (!record.IsObject()) {
        throw ParseError("discover item is not an object");
    }

    const auto* hints = member(record, "url_hints");
    if (!hints || !hints->IsObject()) {
        throw ParseError("discover item without url_hints");
    }
    std::string subdomain = require_string(*hints, "subdomain");
    std::string slug = require_string(*hints, "slug");
    std::string item_type = optional_string(*hints, "item_type").value_or("a");

    CatalogItem item;
    item.id = item_page_url(subdomain, item_type, slug);
    item.kind = item_type == "t" ? EntityKind::Track : EntityKind::Album;
    item.title = require_string(record, "primary_text");
    item.artist = optional_string(record, "secondary_text").value_or("");
    item.genre = optional_string(record, "genre_text").value_or("");
    item.art_url = art_from(record, "art_id");
    return item;
}

LibraryEntry parse_collection_item(const rapidjson::Value& record, AcquisitionKind kind) {
    if (!record.IsObject()) {
        throw ParseError("collection item is not an object");
    }

    std::string url = require_string(record, "item_url");
    std::string title = require_string(record, "item_title");
    std::string artist = optional_string(record, "band_name").value_or("");
    std::string art = art_from(record, "item_art_id");
    auto item_id = optional_id(record, "item_id");

    LibraryEntry entry;
    entry.acquisition = kind;

    const char* primary_stamp = kind == AcquisitionKind::Purchased ? "purchased" : "added";
    const char* fallback_stamp = kind == AcquisitionKind::Purchased ? "added" : "purchased";
    auto stamp = optional_string(record, primary_stamp);
    if (!stamp) {
        stamp = optional_string(record, fallback_stamp);
    }
    if (stamp) {
        entry.acquired_at = parse_timestamp(*stamp);
    }

    if (optional_string(record, "item_type").value_or("album") == "track") {
        Track track;
        track.id = item_id ? std::to_string(*item_id) : url;
        track.title = title;
        track.artist = artist;
        track.album_id = url;
        track.art_url = art;
        entry.item = std::move(track);
    } else {
        Album album;
        album.id = url;
        album.catalog_id = item_id;
        album.title = title;
        album.artist_name = artist;
        if (auto band_id = optional_id(record, "band_id")) {
            album.artist_id = std::to_string(*band_id);
        }
        album.art_url = art;
        entry.item = std::move(album);
    }
    return entry;
}

FanInfo parse_collection_summary(const rapidjson::Value& document) {
    const auto* summary = member(document, "collection_summary");
    if (!summary || !summary->IsObject()) {
        throw AuthExpired("catalog did not recognise the session");
    }
    auto fan_id = optional_id(*summary, "fan_id");
    if (!fan_id) {
        throw AuthExpired("collection summary without fan id");
    }

    FanInfo fan;
    fan.fan_id = *fan_id;
    fan.username = optional_string(*summary, "username").value_or("");
    return fan;
}

std::optional<std::string> extract_tralbum(const std::string& html) {
    static const std::string marker = "data-tralbum=\"";
    auto start = html.find(marker);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    start += marker.size();
    auto end = html.find('"', start);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    return html_unescape(html.substr(start, end - start));
}

std::vector<std::string> extract_tags(const std::string& html) {
    std::vector<std::string> tags;
    auto section = html.find("tralbum-tags");
    if (section == std::string::npos) {
        return tags;
    }
    auto section_end = html.find("</div>", section);
    std::string block = html.substr(section, section_end == std::string::npos
                                                 ? std::string::npos
                                                 : section_end - section);

    static const std::regex pattern("<a class=\"tag\"[^>]*>([^<]+)</a>");
    auto begin = std::sregex_iterator(block.begin(), block.end(), pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        std::string tag = trim(html_unescape((*it)[1].str()));
        if (!tag.empty()) {
            tags.push_back(tag);
        }
    }
    return tags;
}

std::string html_unescape(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out += text[i];
            continue;
        }
        auto semi = text.find(';', i);
        if (semi == std::string::npos || semi - i > 10) {
            out += text[i];
            continue;
        }

        std::string entity = text.substr(i + 1, semi - i - 1);
        if (entity == "quot") {
            out += '"';
        } else if (entity == "amp") {
            out += '&';
        } else if (entity == "lt") {
            out += '<';
        } else if (entity == "gt") {
            out += '>';
        } else if (entity == "apos") {
            out += '\'';
        } else if (entity.size() > 1 && entity[0] == '#') {
            try {
                bool hex = entity[1] == 'x' || entity[1] == 'X';
                unsigned long code = std::stoul(entity.substr(hex ? 2 : 1), nullptr, hex ? 16 : 10);
                append_utf8(out, code);
            } catch (const std::exception&) {
                out += text.substr(i, semi - i + 1);
            }
        } else {
            out += text.substr(i, semi - i + 1);
        }
        i = semi;
    }
    return out;
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream stream(text);
    stream.imbue(std::locale::classic());
    stream >> std::get_time(&tm, "%d %b %Y %H:%M:%S");
    if (stream.fail()) {
        return std::nullopt;
    }
    std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

Album parse_album_page(const std::string& html, const std::string& album_url) {
    auto tralbum_json = extract_tralbum(html);
    if (!tralbum_json) {
        throw ParseError("no tralbum data on " + album_url);
    }

    rapidjson::Document data = parse_json(*tralbum_json, "tralbum");
    const auto* current = member(data, "current");
    if (!current || !current->IsObject()) {
        throw ParseError("tralbum without current release data");
    }

    Album album;
    album.id = album_url;
    album.catalog_id = optional_id(data, "id");
    album.title = require_string(*current, "title");
    album.artist_name = optional_string(*current, "artist")
                            .value_or(optional_string(data, "artist").value_or(""));
    if (auto band_id = optional_id(*current, "band_id")) {
        album.artist_id = std::to_string(*band_id);
    }
    if (auto art_id = optional_id(data, "art_id")) {
        album.art_url = art_url_large(*art_id);
    }
    album.release_date = optional_string(*current, "release_date").value_or("");
    album.tags = extract_tags(html);
    album.genre = album.tags.empty() ? "" : album.tags.front();

    album.format = "Digital";
    if (const auto* packages = member(data, "packages"); packages && packages->IsArray()) {
        for (const auto& package : packages->GetArray()) {
            if (auto name = optional_string(package, "type_name")) {
                album.format += ", " + *name;
            }
        }
    }

    const auto* trackinfo = member(data, "trackinfo");
    if (trackinfo) {
        int position = 0;
        Page<Track> tracks = parse_records<Track>(*trackinfo, "trackinfo",
            [&album, &position](const rapidjson::Value& record) {
                return parse_track_info(record, album, ++position);
            });
        album.tracks = std::move(tracks.items);
    }
    return album;
}

} // namespace camper::bandcamp
