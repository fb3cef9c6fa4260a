#pragma once

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <string>
#include <vector>
#include "../common/models.hpp"
#include "../player/player_state.hpp"
#include "../services/bandcamp/urls.hpp"

namespace camper::control {

class JsonOutput {
public:
    using Allocator = rapidjson::Document::AllocatorType;

    static std::string create_success(const std::string& message) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("success", true, allocator);
        doc.AddMember("message", rapidjson::Value(message.c_str(), allocator), allocator);

        return document_to_string(doc);
    }

    // `kind` lets the caller tell "log in again" from "try again".
    static std::string create_error(const std::string& error, const std::string& kind = "") {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("success", false, allocator);
        doc.AddMember("error", rapidjson::Value(error.c_str(), allocator), allocator);
        if (!kind.empty()) {
            doc.AddMember("kind", rapidjson::Value(kind.c_str(), allocator), allocator);
        }

        return document_to_string(doc);
    }

    // Search and discover listings. `offset` is the listing index of the
    // first item, so "album <index>" keeps working after "more".
    static std::string create_items(const std::vector<CatalogItem>& items, std::size_t offset,
                                    std::size_t skipped, bool more) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        rapidjson::Value results(rapidjson::kArrayType);
        for (std::size_t i = 0; i < items.size(); ++i) {
            const auto& item = items[i];
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("index", static_cast<uint64_t>(offset + i), allocator);
            obj.AddMember("kind", rapidjson::StringRef(to_string(item.kind)), allocator);
            add_string(obj, "title", item.title, allocator);
            add_string(obj, "artist", item.artist, allocator);
            add_string(obj, "genre", item.genre, allocator);
            add_string(obj, "art", item.art_url, allocator);
            add_string(obj, "url", item.id, allocator);
            results.PushBack(obj, allocator);
        }

        doc.AddMember("results", results, allocator);
        doc.AddMember("count", static_cast<uint64_t>(items.size()), allocator);
        doc.AddMember("skipped", static_cast<uint64_t>(skipped), allocator);
        doc.AddMember("more", more, allocator);

        return document_to_string(doc);
    }

    static std::string create_library(const std::vector<LibraryEntry>& entries, std::size_t offset,
                                      std::size_t skipped, bool more) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        rapidjson::Value results(rapidjson::kArrayType);
        for (std::size_t i = 0; i < entries.size(); ++i) {
            const auto& entry = entries[i];
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("index", static_cast<uint64_t>(offset + i), allocator);
            obj.AddMember("kind", rapidjson::StringRef(to_string(entry.kind())), allocator);
            obj.AddMember("acquisition", rapidjson::StringRef(to_string(entry.acquisition)), allocator);
            add_string(obj, "title", entry.title(), allocator);
            add_string(obj, "artist", entry.artist(), allocator);
            add_string(obj, "url", bandcamp::browser_url(entry), allocator);
            if (entry.acquired_at) {
                auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                    entry.acquired_at->time_since_epoch());
                obj.AddMember("acquired_at", static_cast<int64_t>(seconds.count()), allocator);
            }
            results.PushBack(obj, allocator);
        }

        doc.AddMember("results", results, allocator);
        doc.AddMember("count", static_cast<uint64_t>(entries.size()), allocator);
        doc.AddMember("skipped", static_cast<uint64_t>(skipped), allocator);
        doc.AddMember("more", more, allocator);

        return document_to_string(doc);
    }

    static std::string create_album(const Album& album) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        add_string(doc, "url", album.id, allocator);
        add_string(doc, "title", album.title, allocator);
        add_string(doc, "artist", album.artist_name, allocator);
        add_string(doc, "art", album.art_url, allocator);
        add_string(doc, "genre", album.genre, allocator);
        add_string(doc, "format", album.format, allocator);
        add_string(doc, "release_date", album.release_date, allocator);

        rapidjson::Value tags(rapidjson::kArrayType);
        for (const auto& tag : album.tags) {
            tags.PushBack(rapidjson::Value(tag.c_str(), allocator), allocator);
        }
        doc.AddMember("tags", tags, allocator);

        rapidjson::Value tracks(rapidjson::kArrayType);
        for (std::size_t i = 0; i < album.tracks.size(); ++i) {
            rapidjson::Value obj = track_value(album.tracks[i], allocator);
            obj.AddMember("index", static_cast<uint64_t>(i), allocator);
            obj.AddMember("streamable", album.tracks[i].stream_url.has_value(), allocator);
            tracks.PushBack(obj, allocator);
        }
        doc.AddMember("tracks", tracks, allocator);

        return document_to_string(doc);
    }

    static std::string create_status(const PlayerSnapshot& snapshot) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("status", rapidjson::StringRef(to_string(snapshot.status())), allocator);
        if (const QueueEntry* entry = entry_of(snapshot.state)) {
            doc.AddMember("track", track_value(entry->track, allocator), allocator);
            add_string(doc, "origin", to_string(entry->origin.kind), allocator);
        }
        doc.AddMember("position", position_of(snapshot.state), allocator);
        if (snapshot.duration) {
            doc.AddMember("duration", *snapshot.duration, allocator);
        }
        if (const auto* error = std::get_if<state::Error>(&snapshot.state)) {
            doc.AddMember("error_kind", rapidjson::StringRef(to_string(error->cause.kind)), allocator);
            add_string(doc, "error", error->cause.message, allocator);
        }
        doc.AddMember("volume", static_cast<int>(snapshot.volume * 100.0 + 0.5), allocator);
        doc.AddMember("buffering", snapshot.buffering, allocator);
        doc.AddMember("cursor", static_cast<int64_t>(snapshot.cursor), allocator);
        doc.AddMember("queue_length", static_cast<uint64_t>(snapshot.queue_length), allocator);
        doc.AddMember("has_next", snapshot.has_next, allocator);
        doc.AddMember("has_previous", snapshot.has_previous, allocator);

        return document_to_string(doc);
    }

    static std::string create_queue(const std::vector<QueueEntry>& entries, long cursor) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        rapidjson::Value queue(rapidjson::kArrayType);
        for (std::size_t i = 0; i < entries.size(); ++i) {
            rapidjson::Value obj = track_value(entries[i].track, allocator);
            obj.AddMember("index", static_cast<uint64_t>(i), allocator);
            obj.AddMember("current", static_cast<long>(i) == cursor, allocator);
            add_string(obj, "origin", entries[i].origin.label, allocator);
            queue.PushBack(obj, allocator);
        }

        doc.AddMember("queue", queue, allocator);
        doc.AddMember("cursor", static_cast<int64_t>(cursor), allocator);
        doc.AddMember("count", static_cast<uint64_t>(entries.size()), allocator);

        return document_to_string(doc);
    }

    static std::string create_options(const std::vector<bandcamp::Option>& genres,
                                      const std::vector<bandcamp::Option>& sorts,
                                      const std::vector<bandcamp::Option>& formats) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("genres", option_list(genres, allocator), allocator);
        doc.AddMember("sorts", option_list(sorts, allocator), allocator);
        doc.AddMember("formats", option_list(formats, allocator), allocator);

        return document_to_string(doc);
    }

    static std::string create_url(const std::string& url) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("success", true, allocator);
        doc.AddMember("url", rapidjson::Value(url.c_str(), allocator), allocator);

        return document_to_string(doc);
    }

private:
    static void add_string(rapidjson::Value& obj, const char* key, const std::string& value,
                           Allocator& allocator) {
        obj.AddMember(rapidjson::StringRef(key), rapidjson::Value(value.c_str(), allocator), allocator);
    }

    static rapidjson::Value track_value(const Track& track, Allocator& allocator) {
        rapidjson::Value obj(rapidjson::kObjectType);
        add_string(obj, "id", track.id, allocator);
        add_string(obj, "title", track.title, allocator);
        add_string(obj, "artist", track.artist, allocator);
        add_string(obj, "album", track.album_title, allocator);
        obj.AddMember("number", track.track_number, allocator);
        if (track.duration) {
            obj.AddMember("duration", *track.duration, allocator);
        }
        return obj;
    }

    static rapidjson::Value option_list(const std::vector<bandcamp::Option>& options,
                                        Allocator& allocator) {
        rapidjson::Value list(rapidjson::kArrayType);
        for (const auto& option : options) {
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("slug", rapidjson::StringRef(option.slug), allocator);
            obj.AddMember("label", rapidjson::StringRef(option.label), allocator);
            list.PushBack(obj, allocator);
        }
        return list;
    }

    static std::string document_to_string(const rapidjson::Document& doc) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
        return buffer.GetString();
    }
};

} // namespace camper::control
