#include "transcript_view.hpp"

#include "../text_width.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>
#include <vector>

#define cpTranscriptView "\x06\x07\x08"

namespace
{
  int roundToRow(float value)
  {
    return static_cast<int>(std::lround(value));
  }
}

TranscriptView::TranscriptView(const TRect &bounds,
                               TScrollBar *vScroll,
                               const sc::chat::ChatTranscript &transcript,
                               sc::scroll::ViewportRegistry &registry,
                               sc::scroll::ViewportId viewportId)
    : TView(bounds),
      transcript_(transcript),
      vScrollBar_(vScroll),
      viewportId_(viewportId),
      viewport_(registry, std::move(viewportId))
{
  options |= ofSelectable | ofFirstClick;
  eventMask |= evMouseWheel | evBroadcast;
  relayout();
  syncScrollBar();
}

void TranscriptView::setScrollCallback(sc::scroll::ViewportNotifier::Callback callback)
{
  viewport_.setScrollCallback(std::move(callback));
}

sc::scroll::Rect TranscriptView::viewBounds() const noexcept
{
  return sc::scroll::Rect{0.0f, 0.0f, static_cast<float>(std::max(0, static_cast<int>(size.x))),
                          static_cast<float>(std::max(0, static_cast<int>(size.y)))};
}

void TranscriptView::relayout()
{
  std::vector<Viewport::Entry> entries;
  entries.reserve(transcript_.size());
  std::unordered_map<sc::chat::MessageId, std::shared_ptr<const sc::chat::ChatLineItem>> next;
  next.reserve(transcript_.size());

  for (const auto &line : transcript_.lines())
  {
    std::shared_ptr<const sc::chat::ChatLineItem> item;
    auto cached = items_.find(line.id);
    if (cached != items_.end())
      item = cached->second;
    else
      item = std::make_shared<sc::chat::ChatLineItem>(line);
    next.emplace(line.id, item);
    entries.push_back(Viewport::Entry{item, line.id});
  }

  items_ = std::move(next);
  viewport_.layout(entries, viewBounds());
  revision_ = transcript_.revision();
  laidOut_ = true;
}

void TranscriptView::syncScrollBar()
{
  if (!vScrollBar_)
    return;

  const sc::scroll::ViewportSnapshot snapshot = viewport_.snapshot();
  int maxValue = std::max(0, roundToRow(snapshot.contentBounds.height - snapshot.bounds.height));
  int value = std::clamp(roundToRow(snapshot.translation), 0, maxValue);

  // setParams broadcasts cmScrollBarChanged back to us.
  syncingScrollBar_ = true;
  vScrollBar_->setParams(value, 0, maxValue, std::max(1, size.y - 1), 1);
  syncingScrollBar_ = false;
}

void TranscriptView::tick(Clock::time_point now)
{
  bool contentChanged = false;
  if (!laidOut_ || revision_ != transcript_.revision())
  {
    relayout();
    contentChanged = true;
  }

  sc::scroll::Rect visible = getState(sfExposed) ? viewBounds() : sc::scroll::Rect{};
  if (viewport_.needsRedraw(visible))
    viewport_.tick(now);

  if (contentChanged || viewport_.translation() != drawnTranslation_)
  {
    syncScrollBar();
    drawView();
  }

  viewport_.finishFrame();
}

bool TranscriptView::scrollPage(ushort keyCode)
{
  std::optional<sc::scroll::InputEvent> input;
  if (keyCode == kbPgDn)
    input = sc::scroll::InputEvent::pageDown();
  else if (keyCode == kbPgUp)
    input = sc::scroll::InputEvent::pageUp();
  if (!input)
    return false;
  return viewport_.handleInput(*input, std::nullopt, Clock::now());
}

void TranscriptView::draw()
{
  auto colors = getColor(0x0201);
  TColorAttr textAttr = colors[0];
  TColorAttr nameAttr = colors[1];
  TColorAttr localNameAttr = getColor(3)[0];
  int viewWidth = std::max(1, static_cast<int>(size.x));
  int visibleRows = size.y;

  struct ScreenRow
  {
    const std::string *text = nullptr;
    int prefixColumns = 0;
    bool local = false;
  };
  std::vector<ScreenRow> screen(static_cast<std::size_t>(std::max(0, visibleRows)));

  viewport_.forEachVisible([&](std::size_t, const sc::scroll::Rect &bounds, sc::scroll::ItemState &state)
  {
    const sc::chat::WrapState &wrap = sc::chat::ChatLineItem::wrapState(state);
    int top = roundToRow(bounds.y);
    int remainingPrefix = wrap.prefixColumns;
    for (std::size_t row = 0; row < wrap.rows.size(); ++row)
    {
      int y = top + static_cast<int>(row);
      int rowWidth = sc::chat::text::displayWidth(wrap.rows[row]);
      int prefix = std::min(remainingPrefix, rowWidth);
      remainingPrefix -= prefix;
      if (y < 0 || y >= visibleRows)
        continue;
      screen[static_cast<std::size_t>(y)] = ScreenRow{&wrap.rows[row], prefix, wrap.local};
    }
  });

  TDrawBuffer buffer;
  for (int y = 0; y < visibleRows; ++y)
  {
    buffer.moveChar(0, ' ', textAttr, viewWidth);
    const ScreenRow &row = screen[static_cast<std::size_t>(y)];
    if (row.text)
    {
      buffer.moveStr(0, TStringView(*row.text), textAttr, static_cast<ushort>(viewWidth));
      TColorAttr prefixAttr = row.local ? localNameAttr : nameAttr;
      for (int x = 0; x < row.prefixColumns && x < viewWidth; ++x)
        buffer.putAttribute(static_cast<ushort>(x), prefixAttr);
    }
    writeLine(0, y, viewWidth, 1, buffer);
  }

  drawnTranslation_ = viewport_.translation();
}

void TranscriptView::changeBounds(const TRect &bounds)
{
  setBounds(bounds);
  relayout();
  syncScrollBar();
  drawView();
}

void TranscriptView::handleEvent(TEvent &event)
{
  TView::handleEvent(event);

  if (event.what == evMouseWheel)
  {
    float y = 0.0f;
    if (event.mouse.wheel == mwUp)
      y = kWheelStep;
    else if (event.mouse.wheel == mwDown)
      y = -kWheelStep;
    else
      return;

    TPoint local = makeLocal(event.mouse.where);
    sc::scroll::Point pointer{static_cast<float>(local.x), static_cast<float>(local.y)};
    if (viewport_.handleInput(sc::scroll::InputEvent::wheelPixels(y), pointer, Clock::now()))
      clearEvent(event);
  }
  else if (event.what == evKeyDown)
  {
    if (scrollPage(event.keyDown.keyCode))
      clearEvent(event);
  }
  else if (event.what == evBroadcast && event.message.command == cmScrollBarChanged &&
           event.message.infoPtr == vScrollBar_ && vScrollBar_ && !syncingScrollBar_)
  {
    viewport_.scrollTo(static_cast<float>(vScrollBar_->value));
    drawView();
  }
}

TPalette &TranscriptView::getPalette() const
{
  static TPalette palette(cpTranscriptView, sizeof(cpTranscriptView) - 1);
  return palette;
}
