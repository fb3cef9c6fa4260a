#include "command_handler.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include "../services/bandcamp/urls.hpp"

namespace camper::control {

CommandHandler::CommandHandler(bandcamp::ContentClient& client, PlayerStateMachine& player,
                               SessionStore& session)
    : client(client), player(player), session(session) {}

std::string CommandHandler::execute(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    try {
        if (cmd == "search") {
            return handle_search(iss);
        } else if (cmd == "discover") {
            return handle_discover(iss);
        } else if (cmd == "library") {
            return handle_library(iss);
        } else if (cmd == "more") {
            return handle_more();
        } else if (cmd == "album") {
            return handle_album(iss);
        } else if (cmd == "play") {
            return handle_play(iss);
        } else if (cmd == "enqueue") {
            return handle_enqueue(iss);
        } else if (cmd == "next") {
            return send(command::Next{}, "Skipping to next track");
        } else if (cmd == "previous") {
            return send(command::Previous{}, "Going to previous track");
        } else if (cmd == "pause") {
            return send(command::Pause{}, "Playback paused");
        } else if (cmd == "resume") {
            return send(command::Play{}, "Playback resumed");
        } else if (cmd == "toggle") {
            return send(command::TogglePlayPause{}, "Toggled playback");
        } else if (cmd == "seek") {
            return handle_seek(iss);
        } else if (cmd == "retry") {
            return send(command::Retry{}, "Retrying");
        } else if (cmd == "stop") {
            return send(command::Stop{}, "Playback stopped");
        } else if (cmd == "volume") {
            return handle_volume(iss);
        } else if (cmd == "jump") {
            return handle_jump(iss);
        } else if (cmd == "remove") {
            return handle_remove(iss);
        } else if (cmd == "clear") {
            return send(command::ClearQueue{}, "Queue cleared");
        } else if (cmd == "queue") {
            return JsonOutput::create_queue(player.queue_entries(), player.snapshot().cursor);
        } else if (cmd == "status") {
            return JsonOutput::create_status(player.snapshot());
        } else if (cmd == "open") {
            return handle_open(iss);
        } else if (cmd == "login") {
            return handle_login(iss);
        } else if (cmd == "logout") {
            return handle_logout();
        } else if (cmd == "genres") {
            return JsonOutput::create_options(bandcamp::genres(), bandcamp::sort_options(),
                                              bandcamp::format_options());
        } else if (cmd == "quit") {
            quit = true;
            return JsonOutput::create_success("Bye");
        } else {
            return JsonOutput::create_error("Unknown command: " + cmd, "usage");
        }
    } catch (const AuthExpired& e) {
        return report(ErrorKind::AuthExpired, e.what());
    } catch (const NetworkError& e) {
        return report(ErrorKind::Network, e.what());
    } catch (const ParseError& e) {
        return report(ErrorKind::Parse, e.what());
    } catch (const std::invalid_argument& e) {
        return JsonOutput::create_error(e.what(), "usage");
    } catch (const std::out_of_range& e) {
        return JsonOutput::create_error(e.what(), "usage");
    } catch (const std::exception& e) {
        spdlog::error("console: \"{}\" failed: {}", line, e.what());
        return JsonOutput::create_error(std::string("Error: ") + e.what());
    }
}

std::string CommandHandler::report(ErrorKind kind, const std::string& message) {
    spdlog::warn("console: {} error: {}", to_string(kind), message);
    if (notify && (kind == ErrorKind::Network || kind == ErrorKind::AuthExpired)) {
        notify(kind, message);
    }
    return JsonOutput::create_error(message, to_string(kind));
}

std::string CommandHandler::send(Command cmd, const std::string& message) {
    player.post(std::move(cmd));
    return JsonOutput::create_success(message);
}

// Browsing

std::string CommandHandler::handle_search(std::istringstream& args) {
    bandcamp::SearchFilter filter = bandcamp::SearchFilter::All;
    std::string query = rest_of(args);

    if (query.rfind("--", 0) == 0) {
        std::string flag = query.substr(0, query.find(' '));
        if (flag == "--albums") {
            filter = bandcamp::SearchFilter::Albums;
        } else if (flag == "--tracks") {
            filter = bandcamp::SearchFilter::Tracks;
        } else if (flag == "--artists") {
            filter = bandcamp::SearchFilter::Artists;
        } else if (flag != "--all") {
            throw std::invalid_argument("unknown search filter " + flag);
        }
        std::size_t start = query.find_first_not_of(' ', flag.size());
        query = start == std::string::npos ? "" : query.substr(start);
    }
    if (query.empty()) {
        throw std::invalid_argument("usage: search [--albums|--tracks|--artists] <query>");
    }

    library_query.reset();
    catalog_query.emplace(client.search_pages(query, filter));
    listing.clear();
    listing_kind = Listing::Catalog;
    listing_origin = OriginKind::Search;
    return show_catalog_page(catalog_query->next_page());
}

std::string CommandHandler::handle_discover(std::istringstream& args) {
    bandcamp::DiscoverQuery query;
    std::string word;
    int position = 0;
    while (args >> word) {
        if (word.rfind("tag=", 0) == 0) {
            query.tag = word.substr(4);
            continue;
        }
        switch (position++) {
        case 0: query.genre = word; break;
        case 1: query.sort = word; break;
        case 2: query.format = word; break;
        default: throw std::invalid_argument("usage: discover [genre] [sort] [format] [tag=<tag>]");
        }
    }

    library_query.reset();
    catalog_query.emplace(client.discover_pages(query));
    listing.clear();
    listing_kind = Listing::Catalog;
    listing_origin = OriginKind::Discover;
    return show_catalog_page(catalog_query->next_page());
}

std::string CommandHandler::handle_library(std::istringstream& args) {
    std::string which = "purchased";
    args >> which;

    bandcamp::LibraryKind kind;
    if (which == "purchased") {
        kind = bandcamp::LibraryKind::Purchased;
    } else if (which == "wishlist") {
        kind = bandcamp::LibraryKind::Wishlist;
    } else {
        throw std::invalid_argument("usage: library [purchased|wishlist]");
    }

    catalog_query.reset();
    library_query.emplace(client.library_pages(kind));
    listing.clear();
    listing_kind = Listing::Library;
    listing_origin = OriginKind::Library;
    return show_library_page(library_query->next_page());
}

std::string CommandHandler::handle_more() {
    switch (listing_kind) {
    case Listing::Catalog:
        return show_catalog_page(catalog_query->next_page());
    case Listing::Library:
        return show_library_page(library_query->next_page());
    case Listing::None:
        break;
    }
    return JsonOutput::create_error("Nothing to page through, search or browse first", "usage");
}

std::string CommandHandler::show_catalog_page(bandcamp::Page<CatalogItem> page) {
    std::size_t offset = listing.size();
    listing.insert(listing.end(), page.items.begin(), page.items.end());
    return JsonOutput::create_items(page.items, offset, page.skipped, catalog_query->has_more());
}

std::string CommandHandler::show_library_page(bandcamp::Page<LibraryEntry> page) {
    std::size_t offset = listing.size();
    for (const auto& entry : page.items) {
        CatalogItem item;
        item.id = bandcamp::browser_url(entry);
        item.title = entry.title();
        item.artist = entry.artist();
        item.kind = entry.kind();
        if (const auto* owned = std::get_if<Album>(&entry.item)) {
            item.art_url = owned->art_url;
            item.genre = owned->genre;
        } else {
            item.art_url = std::get<Track>(entry.item).art_url;
        }
        listing.push_back(std::move(item));
    }
    return JsonOutput::create_library(page.items, offset, page.skipped, library_query->has_more());
}

std::string CommandHandler::handle_album(std::istringstream& args) {
    std::size_t index = read_index(args);
    if (index >= listing.size()) {
        throw std::out_of_range("no item " + std::to_string(index) + " in the current listing");
    }
    const CatalogItem& item = listing[index];
    if (item.kind == EntityKind::Artist) {
        throw std::invalid_argument("\"" + item.title + "\" is an artist, use open " + std::to_string(index));
    }

    album = client.resolve_album(item.id);
    album_origin = listing_origin;
    return JsonOutput::create_album(*album);
}

// Playback

const Track& CommandHandler::album_track(std::size_t index) const {
    if (!album) {
        throw std::invalid_argument("open an album first");
    }
    if (index >= album->tracks.size()) {
        throw std::out_of_range("album has no track " + std::to_string(index));
    }
    return album->tracks[index];
}

QueueEntry CommandHandler::album_entry(std::size_t index) const {
    album_track(index);
    return make_queue_entries(*album, album_origin)[index];
}

std::string CommandHandler::handle_play(std::istringstream& args) {
    std::istringstream index_args(rest_of(args));
    if (index_args.str().empty()) {
        return send(command::Play{}, "Playback resumed");
    }

    std::size_t index = read_index(index_args);
    const Track& track = album_track(index);
    std::string message = "Playing " + track.to_string();
    return send(command::ReplaceQueue{make_queue_entries(*album, album_origin), index}, message);
}

std::string CommandHandler::handle_enqueue(std::istringstream& args) {
    std::string word;
    if (!(args >> word)) {
        throw std::invalid_argument("usage: enqueue [next] <track index>");
    }

    bool next = word == "next";
    std::istringstream index_args(next ? rest_of(args) : word);
    QueueEntry entry = album_entry(read_index(index_args));
    std::string title = entry.track.to_string();

    if (next) {
        return send(command::EnqueueNext{std::move(entry)}, "Playing next: " + title);
    }
    return send(command::Enqueue{std::move(entry)}, "Queued: " + title);
}

std::string CommandHandler::handle_seek(std::istringstream& args) {
    double position;
    if (!(args >> position) || position < 0) {
        throw std::invalid_argument("usage: seek <seconds>");
    }
    return send(command::Seek{position}, "Seeking to " + std::to_string(static_cast<int>(position)) + " seconds");
}

std::string CommandHandler::handle_volume(std::istringstream& args) {
    int volume;
    if (!(args >> volume) || volume < 0 || volume > 100) {
        return JsonOutput::create_error("Volume must be between 0 and 100", "usage");
    }
    return send(command::SetVolume{volume / 100.0}, "Volume set to " + std::to_string(volume));
}

std::string CommandHandler::handle_jump(std::istringstream& args) {
    std::size_t index = read_index(args);
    if (index >= player.snapshot().queue_length) {
        throw std::out_of_range("queue has no entry " + std::to_string(index));
    }
    return send(command::PlayRequested{index}, "Jumping to queue entry " + std::to_string(index));
}

std::string CommandHandler::handle_remove(std::istringstream& args) {
    std::size_t index = read_index(args);
    if (index >= player.snapshot().queue_length) {
        throw std::out_of_range("queue has no entry " + std::to_string(index));
    }
    return send(command::RemoveAt{index}, "Removed queue entry " + std::to_string(index));
}

// Outer collaborators

std::string CommandHandler::handle_open(std::istringstream& args) {
    std::string url;
    std::istringstream index_args(rest_of(args));
    if (!index_args.str().empty()) {
        std::size_t index = read_index(index_args);
        if (index >= listing.size()) {
            throw std::out_of_range("no item " + std::to_string(index) + " in the current listing");
        }
        url = bandcamp::browser_url(listing[index]);
    } else if (const QueueEntry* entry = entry_of(player.snapshot().state)) {
        url = bandcamp::browser_url(*entry);
    } else if (album) {
        url = bandcamp::browser_url(*album);
    } else {
        return JsonOutput::create_error("Nothing to open", "usage");
    }

    if (open_url) {
        open_url(url);
    }
    return JsonOutput::create_url(url);
}

std::string CommandHandler::handle_login(std::istringstream& args) {
    std::string blob = rest_of(args);
    if (blob.empty()) {
        throw std::invalid_argument("usage: login <cookie header value>");
    }
    session.update(blob);
    FanInfo fan = client.fan();
    return JsonOutput::create_success("Logged in as " + fan.username);
}

std::string CommandHandler::handle_logout() {
    session.logout();
    library_query.reset();
    if (listing_kind == Listing::Library) {
        listing.clear();
        listing_kind = Listing::None;
    }
    return JsonOutput::create_success("Logged out");
}

std::size_t CommandHandler::read_index(std::istringstream& args) {
    std::string word;
    if (!(args >> word)) {
        throw std::invalid_argument("missing index");
    }
    if (word.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("not an index: " + word);
    }
    return static_cast<std::size_t>(std::stoul(word));
}

std::string CommandHandler::rest_of(std::istringstream& args) {
    std::string rest;
    std::getline(args, rest);
    std::size_t first = rest.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = rest.find_last_not_of(" \t\r");
    return rest.substr(first, last - first + 1);
}

} // namespace camper::control
