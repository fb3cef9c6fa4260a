#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "../player/state_machine.hpp"
#include "../services/bandcamp/content_client.hpp"
#include "../storage/session_store.hpp"
#include "json_output.hpp"

namespace camper::control {

// Line-oriented control surface standing in for the GUI: one text command
// in, one JSON object out. Browsing goes straight to the content client;
// everything that touches playback is posted to the player.
class CommandHandler {
public:
    using Notifier = std::function<void(ErrorKind kind, const std::string& message)>;
    using UrlOpener = std::function<void(const std::string& url)>;

    CommandHandler(bandcamp::ContentClient& client, PlayerStateMachine& player,
                   SessionStore& session);

    void set_notifier(Notifier notifier) { notify = std::move(notifier); }
    void set_url_opener(UrlOpener opener) { open_url = std::move(opener); }

    std::string execute(const std::string& line);

    bool quit_requested() const { return quit; }

private:
    enum class Listing { None, Catalog, Library };

    std::string handle_search(std::istringstream& args);
    std::string handle_discover(std::istringstream& args);
    std::string handle_library(std::istringstream& args);
    std::string handle_more();
    std::string handle_album(std::istringstream& args);
    std::string handle_play(std::istringstream& args);
    std::string handle_enqueue(std::istringstream& args);
    std::string handle_seek(std::istringstream& args);
    std::string handle_volume(std::istringstream& args);
    std::string handle_jump(std::istringstream& args);
    std::string handle_remove(std::istringstream& args);
    std::string handle_open(std::istringstream& args);
    std::string handle_login(std::istringstream& args);
    std::string handle_logout();

    std::string show_catalog_page(bandcamp::Page<CatalogItem> page);
    std::string show_library_page(bandcamp::Page<LibraryEntry> page);
    std::string send(Command cmd, const std::string& message);
    const Track& album_track(std::size_t index) const;
    QueueEntry album_entry(std::size_t index) const;
    std::string report(ErrorKind kind, const std::string& message);

    static std::size_t read_index(std::istringstream& args);
    static std::string rest_of(std::istringstream& args);

    bandcamp::ContentClient& client;
    PlayerStateMachine& player;
    SessionStore& session;
    Notifier notify;
    UrlOpener open_url;

    Listing listing_kind = Listing::None;
    OriginKind listing_origin = OriginKind::Search;
    std::optional<bandcamp::PagedQuery<CatalogItem>> catalog_query;
    std::optional<bandcamp::PagedQuery<LibraryEntry>> library_query;
    // Everything listed since the last search/discover/library, for selection by index.
    std::vector<CatalogItem> listing;

    std::optional<Album> album;
    OriginKind album_origin = OriginKind::Album;
    bool quit = false;
};

} // namespace camper::control
