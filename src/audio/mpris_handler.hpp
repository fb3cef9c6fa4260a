#pragma once

#include <functional>
#include <map>
#include <memory>
#include <sdbus-c++/sdbus-c++.h>
#include <string>
#include "mpris_adapter.hpp"

namespace camper {

// Publishes the adapter on the session bus as org.mpris.MediaPlayer2.camper.
class MPRISHandler {
private:
  MprisAdapter &adapter;
  std::function<void()> on_quit;
  std::unique_ptr<sdbus::IConnection> connection;
  std::unique_ptr<sdbus::IObject> object;

public:
  MPRISHandler(MprisAdapter &adapter, std::function<void()> quit_callback);
  ~MPRISHandler();

  MPRISHandler(const MPRISHandler &) = delete;
  MPRISHandler &operator=(const MPRISHandler &) = delete;

  // Throws sdbus::Error when no session bus is reachable.
  void initialize();
  void startEventLoop();
  void cleanup();

private:
  void setupInterfaces();
  void onPropertiesChanged(const MprisProperties &props, bool seeked);
  std::map<std::string, sdbus::Variant> getMetadata() const;
};

} // namespace camper
