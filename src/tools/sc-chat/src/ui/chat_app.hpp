#pragma once

#include "sc/options.hpp"
#include "sc/scroll/viewport_registry.hpp"

#include "../replay_feed.hpp"
#include "../tvision_include.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ChatWindow;

class ChatApp : public TApplication {
public:
  struct StartupOptions {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> replayPath;
    std::vector<std::string> channels;
  };

  ChatApp(int argc, char **argv, const StartupOptions &startup);

  virtual void handleEvent(TEvent &event) override;
  virtual void idle() override;

  TMenuBar *initMenuBar(TRect r);
  static TStatusLine *initStatusLine(TRect r);

  void registerWindow(ChatWindow *window);
  void unregisterWindow(ChatWindow *window);

  sc::scroll::ViewportRegistry &viewports() noexcept { return viewports_; }
  std::size_t scrollbackLimit() const;
  std::string userName() const;
  bool naturalScrolling() const noexcept { return naturalScrolling_; }

private:
  void openChatWindow(const std::string &channel);
  void promptNewChannel();
  void showAboutDialog();
  void rebuildMenuBar();
  void setNaturalScrolling(bool enabled);
  void persistBoolOption(const std::string &key, bool value);
  void applySettingsToWindow(ChatWindow &window);
  ChatWindow *windowForChannel(const std::string &channel) const;
  void openReplay(const std::filesystem::path &path);
  void pollReplay();

  sc::scroll::ViewportRegistry viewports_;
  std::vector<ChatWindow *> windows;
  int nextWindowNumber = 1;
  bool naturalScrolling_ = false;
  std::optional<sc::chat::ReplayFeed> replay_;
  std::string startupError_;
  std::filesystem::path binaryDir_;

  std::shared_ptr<sc::config::OptionRegistry> optionRegistry_;
};
