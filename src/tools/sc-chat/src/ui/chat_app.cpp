#include "chat_app.hpp"
#include "../commands.hpp"
#include "chat_options.hpp"
#include "chat_window.hpp"

#include "sc/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace
{
  constexpr char kDefaultChannel[] = "general";
  constexpr int kMaxChannelLength = 64;

  std::filesystem::path binary_dir(int argc, char **argv)
  {
    std::error_code ec;
    if (argv && argc > 0 && argv[0])
    {
      std::filesystem::path dir =
          std::filesystem::absolute(std::filesystem::path(argv[0]), ec)
              .parent_path();
      if (!ec && !dir.empty())
        return dir;
    }
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
  }

  std::string channel_name(std::string text)
  {
    auto begin = text.find_first_not_of(" \t#");
    if (begin == std::string::npos)
      return std::string();
    auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
  }
} // namespace

ChatApp::ChatApp(int argc, char **argv, const StartupOptions &startup)
    : TProgInit(&ChatApp::initStatusLine, nullptr, &TApplication::initDeskTop)
{
  binaryDir_ = binary_dir(argc, argv);
  if (!std::getenv("SC_CHAT_LOG"))
    sc::log::setLogFile(binaryDir_ / "sc-chat.log", true);
  sc::log::info("sc-chat starting");

  optionRegistry_ = std::make_shared<sc::config::OptionRegistry>("sc-chat");
  sc::chat::registerChatOptions(*optionRegistry_);
  if (startup.configPath)
    optionRegistry_->setStorePath(*startup.configPath);
  if (!optionRegistry_->loadDefaults())
    sc::log::info("using default options; no store at " +
                  optionRegistry_->storePath().string());
  naturalScrolling_ =
      optionRegistry_->getBool(sc::chat::kOptionNaturalScrolling, false);

  rebuildMenuBar();

  std::vector<std::string> channels = startup.channels;
  if (channels.empty())
    channels = optionRegistry_->getStringList(sc::chat::kOptionChannels);
  for (const auto &channel : channels)
  {
    std::string name = channel_name(channel);
    if (!name.empty() && !windowForChannel(name))
      openChatWindow(name);
  }
  if (windows.empty())
    openChatWindow(kDefaultChannel);

  if (startup.replayPath)
    openReplay(*startup.replayPath);
}

void ChatApp::registerWindow(ChatWindow *window)
{
  if (!window)
    return;
  windows.push_back(window);
  applySettingsToWindow(*window);
}

void ChatApp::unregisterWindow(ChatWindow *window)
{
  auto it = std::remove(windows.begin(), windows.end(), window);
  windows.erase(it, windows.end());
}

std::size_t ChatApp::scrollbackLimit() const
{
  return sc::chat::scrollbackLimit(*optionRegistry_);
}

std::string ChatApp::userName() const
{
  return sc::chat::userName(*optionRegistry_);
}

void ChatApp::openChatWindow(const std::string &channel)
{
  if (!deskTop)
    return;

  TRect bounds = deskTop->getExtent();
  bounds.grow(-1, 0);
  int offset = static_cast<int>(windows.size() % 6);
  bounds.a.x += offset;
  bounds.a.y += offset;
  if (bounds.b.x <= bounds.a.x + 50 || bounds.b.y <= bounds.a.y + 16)
    bounds = TRect(0, 0, 70, 20);

  auto *window = new ChatWindow(*this, bounds, nextWindowNumber++, channel);
  deskTop->insert(window);
  window->select();
  sc::log::info("opened channel #" + channel);
}

void ChatApp::promptNewChannel()
{
  char buffer[kMaxChannelLength + 1] = {};
  if (inputBox("New Channel", "~C~hannel", buffer, kMaxChannelLength) != cmOK)
    return;
  std::string name = channel_name(buffer);
  if (name.empty())
    return;
  if (ChatWindow *existing = windowForChannel(name))
  {
    existing->select();
    return;
  }
  openChatWindow(name);
}

ChatWindow *ChatApp::windowForChannel(const std::string &channel) const
{
  for (auto *window : windows)
  {
    if (window && window->channel() == channel)
      return window;
  }
  return nullptr;
}

void ChatApp::openReplay(const std::filesystem::path &path)
{
  try
  {
    replay_ = sc::chat::ReplayFeed::open(path);
  }
  catch (const std::runtime_error &e)
  {
    sc::log::error(e.what());
    startupError_ = e.what();
    return;
  }
  if (replay_->skippedLines() > 0)
    sc::log::warn(std::to_string(replay_->skippedLines()) +
                  " malformed replay lines skipped");
}

void ChatApp::pollReplay()
{
  if (!replay_)
    return;

  auto now = sc::chat::ReplayFeed::Clock::now();
  if (!replay_->started())
    replay_->start(now);

  for (const auto &entry : replay_->poll(now))
  {
    ChatWindow *target = nullptr;
    if (!entry.channel.empty())
    {
      target = windowForChannel(entry.channel);
      if (!target)
      {
        openChatWindow(entry.channel);
        target = windowForChannel(entry.channel);
      }
    }
    else if (!windows.empty())
      target = windows.front();

    if (target)
      target->deliver(entry);
  }

  if (replay_->finished())
  {
    sc::log::info("replay finished");
    replay_.reset();
  }
}

void ChatApp::handleEvent(TEvent &event)
{
  TApplication::handleEvent(event);
  if (event.what == evCommand)
  {
    switch (event.message.command)
    {
    case cmNewChannel:
      promptNewChannel();
      clearEvent(event);
      break;
    case cmAbout:
      showAboutDialog();
      clearEvent(event);
      break;
    case cmToggleNaturalScrolling:
      setNaturalScrolling(!naturalScrolling_);
      clearEvent(event);
      break;
    default:
      break;
    }
  }
}

void ChatApp::idle()
{
  TApplication::idle();

  if (!startupError_.empty())
  {
    std::string message = startupError_;
    startupError_.clear();
    messageBox(message.c_str(), mfError | mfOKButton);
  }

  pollReplay();

  auto now = std::chrono::steady_clock::now();
  for (auto *window : windows)
  {
    if (window)
      window->tick(now);
  }
}

TMenuBar *ChatApp::initMenuBar(TRect r)
{
  r.b.y = r.a.y + 1;

  TSubMenu &fileMenu = *new TSubMenu("~F~ile", hcNoContext) +
                       *new TMenuItem("~N~ew Channel...", cmNewChannel, kbAltN,
                                      hcNoContext, "Alt-N") +
                       *new TMenuItem("~C~lose Window", cmClose, kbAltF3,
                                      hcNoContext, "Alt-F3") +
                       newLine() +
                       *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext,
                                      "Alt-X");

  TSubMenu &searchMenu = *new TSubMenu("~S~earch", hcNoContext) +
                         *new TMenuItem("~F~ind...", cmFindInScrollback,
                                        kbCtrlF, hcNoContext, "Ctrl-F") +
                         *new TMenuItem("Find ~N~ext", cmFindNext, kbF3,
                                        hcNoContext, "F3");

  std::string naturalLabel =
      std::string(naturalScrolling_ ? "[x] " : "[ ] ") + "Natural Scrolling";
  TSubMenu &viewMenu = *new TSubMenu("~V~iew", hcNoContext) +
                       *new TMenuItem("Jump to ~T~op", cmJumpToTop, kbCtrlHome,
                                      hcNoContext, "Ctrl-Home") +
                       *new TMenuItem("Jump to ~B~ottom", cmJumpToBottom,
                                      kbCtrlEnd, hcNoContext, "Ctrl-End") +
                       newLine() +
                       *new TMenuItem(naturalLabel.c_str(),
                                      cmToggleNaturalScrolling, kbNoKey,
                                      hcNoContext);

  TSubMenu &windowMenu = *new TSubMenu("~W~indow", hcNoContext) +
                         *new TMenuItem("~Z~oom", cmZoom, kbF5, hcNoContext,
                                        "F5") +
                         *new TMenuItem("~N~ext", cmNext, kbF6, hcNoContext,
                                        "F6") +
                         *new TMenuItem("~T~ile", cmTile, kbNoKey, hcNoContext) +
                         *new TMenuItem("C~a~scade", cmCascade, kbNoKey,
                                        hcNoContext);

  TMenuItem &menuChain =
      fileMenu + searchMenu + viewMenu + windowMenu +
      *new TSubMenu("~H~elp", hcNoContext) +
      *new TMenuItem("~A~bout", cmAbout, kbNoKey, hcNoContext);

  return new TMenuBar(r, static_cast<TSubMenu &>(menuChain));
}

TStatusLine *ChatApp::initStatusLine(TRect r)
{
  r.a.y = r.b.y - 1;

  auto *newItem = new TStatusItem("~Alt-N~ New Channel", kbAltN, cmNewChannel);
  auto *findItem = new TStatusItem("~Ctrl-F~ Find", kbCtrlF, cmFindInScrollback);
  auto *bottomItem =
      new TStatusItem("~Ctrl-End~ Bottom", kbCtrlEnd, cmJumpToBottom);
  auto *closeItem = new TStatusItem("~Alt-F3~ Close", kbAltF3, cmClose);
  auto *quitItem = new TStatusItem("~Alt-X~ Quit", kbAltX, cmQuit);
  newItem->next = findItem;
  findItem->next = bottomItem;
  bottomItem->next = closeItem;
  closeItem->next = quitItem;

  return new TStatusLine(r, *new TStatusDef(0, 0xFFFF, newItem));
}

void ChatApp::showAboutDialog()
{
#ifdef SC_CHAT_VERSION
  std::string version = SC_CHAT_VERSION;
#else
  std::string version = "dev";
#endif
  std::string text = "\x3sc-chat " + version +
                     "\n\n\x3Chat transcript with a virtualized,\n"
                     "\x3position-preserving scroll viewport.";
  messageBox(text.c_str(), mfInformation | mfOKButton);
}

void ChatApp::setNaturalScrolling(bool enabled)
{
  if (naturalScrolling_ == enabled)
    return;
  naturalScrolling_ = enabled;
  persistBoolOption(sc::chat::kOptionNaturalScrolling, naturalScrolling_);
  for (auto *window : windows)
  {
    if (window)
      applySettingsToWindow(*window);
  }
  rebuildMenuBar();
}

void ChatApp::persistBoolOption(const std::string &key, bool value)
{
  if (!optionRegistry_)
    return;
  sc::config::OptionValue desired(value);
  if (optionRegistry_->get(key) == desired)
    return;
  optionRegistry_->set(key, desired);
  if (!optionRegistry_->saveDefaults())
    sc::log::warn("could not save option '" + key + "'");
}

void ChatApp::applySettingsToWindow(ChatWindow &window)
{
  window.applySettings(naturalScrolling_,
                       sc::chat::animationRate(*optionRegistry_),
                       scrollbackLimit());
}

void ChatApp::rebuildMenuBar()
{
  if (!deskTop)
    return;

  TRect bounds;
  if (TProgram::menuBar)
    bounds = TProgram::menuBar->getBounds();
  else
  {
    bounds = getExtent();
    bounds.b.y = bounds.a.y + 1;
  }

  if (TProgram::menuBar)
  {
    TMenuBar *oldBar = TProgram::menuBar;
    remove(oldBar);
    TObject::destroy(oldBar);
  }

  TMenuBar *newBar = initMenuBar(bounds);
  if (newBar)
  {
    insert(newBar);
    TProgram::menuBar = newBar;
    newBar->drawView();
  }
}
