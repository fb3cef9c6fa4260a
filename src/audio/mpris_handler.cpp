#include "mpris_handler.hpp"

#include <cstdint>
#include <spdlog/spdlog.h>
#include <vector>

namespace camper {

namespace {

const sdbus::InterfaceName root_interface{"org.mpris.MediaPlayer2"};
const sdbus::InterfaceName player_interface{"org.mpris.MediaPlayer2.Player"};

} // namespace

MPRISHandler::MPRISHandler(MprisAdapter &adapter, std::function<void()> quit_callback)
    : adapter(adapter), on_quit(std::move(quit_callback)) {}

MPRISHandler::~MPRISHandler() { cleanup(); }

void MPRISHandler::initialize() {
  sdbus::ServiceName serviceName{"org.mpris.MediaPlayer2.camper"};
  connection = sdbus::createSessionBusConnection(serviceName);
  sdbus::ObjectPath objectPath{"/org/mpris/MediaPlayer2"};
  object = sdbus::createObject(*connection, std::move(objectPath));

  setupInterfaces();

  adapter.set_changed_callback([this](const MprisProperties &props, bool seeked) {
    onPropertiesChanged(props, seeked);
  });
  spdlog::info("MPRIS: registered {}", std::string(serviceName));
}

void MPRISHandler::startEventLoop() {
  if (connection) {
    connection->enterEventLoopAsync();
  }
}

void MPRISHandler::cleanup() {
  adapter.set_changed_callback(nullptr);

  if (connection) {
    connection->leaveEventLoop();
  }

  // Clear objects in correct order
  object.reset();
  connection.reset();
}

void MPRISHandler::setupInterfaces() {
  object
      ->addVTable(sdbus::registerMethod("Raise").implementedAs([]() {}),
                  sdbus::registerMethod("Quit").implementedAs([this]() {
                    if (on_quit)
                      on_quit();
                  }),
                  sdbus::registerProperty("Identity").withGetter([]() {
                    return std::string("camper");
                  }),
                  sdbus::registerProperty("DesktopEntry").withGetter([]() {
                    return std::string("camper");
                  }),
                  sdbus::registerProperty("CanQuit").withGetter([]() { return true; }),
                  sdbus::registerProperty("CanRaise").withGetter([]() { return false; }),
                  sdbus::registerProperty("HasTrackList").withGetter([]() { return false; }),
                  sdbus::registerProperty("SupportedUriSchemes").withGetter([]() {
                    return std::vector<std::string>{};
                  }),
                  sdbus::registerProperty("SupportedMimeTypes").withGetter([]() {
                    return std::vector<std::string>{};
                  }))
      .forInterface(root_interface);

  object
      ->addVTable(
          sdbus::registerMethod("PlayPause").implementedAs([this]() { adapter.play_pause(); }),
          sdbus::registerMethod("Play").implementedAs([this]() { adapter.play(); }),
          sdbus::registerMethod("Pause").implementedAs([this]() { adapter.pause(); }),
          sdbus::registerMethod("Stop").implementedAs([this]() { adapter.stop(); }),
          sdbus::registerMethod("Next").implementedAs([this]() { adapter.next(); }),
          sdbus::registerMethod("Previous").implementedAs([this]() { adapter.previous(); }),
          sdbus::registerMethod("Seek")
              .withInputParamNames("Offset")
              .implementedAs([this](int64_t offset) { adapter.seek(offset); }),
          sdbus::registerMethod("SetPosition")
              .withInputParamNames("TrackId", "Position")
              .implementedAs([this](const sdbus::ObjectPath &trackId, int64_t position) {
                adapter.set_position(trackId, position);
              }),
          sdbus::registerMethod("OpenUri")
              .withInputParamNames("Uri")
              .implementedAs([](const std::string &uri) {
                spdlog::debug("MPRIS: OpenUri({}) not supported", uri);
              }),
          sdbus::registerSignal("Seeked").withParameters<int64_t>("Position"),
          sdbus::registerProperty("PlaybackStatus").withGetter([this]() {
            return adapter.properties().playback_status;
          }),
          sdbus::registerProperty("Metadata").withGetter([this]() { return getMetadata(); }),
          sdbus::registerProperty("Position").withGetter([this]() {
            return adapter.properties().position_us;
          }),
          sdbus::registerProperty("Volume")
              .withGetter([this]() { return adapter.properties().volume; })
              .withSetter([this](const double &volume) { adapter.set_volume(volume); }),
          sdbus::registerProperty("Rate").withGetter([]() { return 1.0; }),
          sdbus::registerProperty("MinimumRate").withGetter([]() { return 1.0; }),
          sdbus::registerProperty("MaximumRate").withGetter([]() { return 1.0; }),
          sdbus::registerProperty("CanGoNext").withGetter([this]() {
            return adapter.properties().can_go_next;
          }),
          sdbus::registerProperty("CanGoPrevious").withGetter([this]() {
            return adapter.properties().can_go_previous;
          }),
          sdbus::registerProperty("CanPlay").withGetter([this]() {
            return adapter.properties().can_play;
          }),
          sdbus::registerProperty("CanPause").withGetter([this]() {
            return adapter.properties().can_pause;
          }),
          sdbus::registerProperty("CanSeek").withGetter([this]() {
            return adapter.properties().can_seek;
          }),
          sdbus::registerProperty("CanControl").withGetter([]() { return true; }))
      .forInterface(player_interface);
}

std::map<std::string, sdbus::Variant> MPRISHandler::getMetadata() const {
  const MprisMetadata metadata = adapter.properties().metadata;
  std::map<std::string, sdbus::Variant> result;

  result["mpris:trackid"] = sdbus::Variant(sdbus::ObjectPath{metadata.track_id});
  if (metadata.track_id == MprisAdapter::no_track_path) {
    return result;
  }

  result["xesam:title"] = sdbus::Variant(metadata.title);
  result["xesam:artist"] = sdbus::Variant(metadata.artists);
  if (!metadata.album.empty()) {
    result["xesam:album"] = sdbus::Variant(metadata.album);
  }
  if (!metadata.art_url.empty()) {
    result["mpris:artUrl"] = sdbus::Variant(metadata.art_url);
  }
  if (!metadata.url.empty()) {
    result["xesam:url"] = sdbus::Variant(metadata.url);
  }
  if (metadata.length_us > 0) {
    result["mpris:length"] = sdbus::Variant(metadata.length_us);
  }
  return result;
}

void MPRISHandler::onPropertiesChanged(const MprisProperties &props, bool seeked) {
  if (!object) {
    return;
  }
  try {
    object->emitPropertiesChangedSignal(player_interface);
    if (seeked) {
      object->emitSignal("Seeked").onInterface(player_interface).withArguments(props.position_us);
    }
  } catch (const sdbus::Error &e) {
    spdlog::warn("MPRIS: signal emission failed: {}", e.getMessage());
  }
}

} // namespace camper
