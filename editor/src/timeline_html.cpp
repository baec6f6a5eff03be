#include "EvflEditor/editor/timeline_html.hpp"

#include <QJsonDocument>

namespace EvflEditor::editor {

namespace {

const char* kPageTemplate = R"HTML(<!DOCTYPE html>
<html>
<head>
<meta charset="UTF-8">
<style>
  body {
    margin: 0;
    padding: 20px;
    font-family: Arial, sans-serif;
    background: #2b2b2b;
    color: #ffffff;
    overflow-x: auto;
  }
  #timeline-container { position: relative; min-height: 500px; }
  .track {
    position: relative;
    height: 40px;
    margin-bottom: 5px;
    background: #3a3a3a;
    border-radius: 3px;
  }
  .track-label {
    position: absolute;
    left: 10px;
    top: 10px;
    font-weight: bold;
    font-size: 12px;
    color: #aaa;
    z-index: 10;
  }
  .clip {
    position: absolute;
    height: 35px;
    top: 2.5px;
    border-radius: 3px;
    cursor: pointer;
    border: 2px solid transparent;
    transition: border-color 0.2s;
    overflow: hidden;
  }
  .clip:hover { border-color: #fff; }
  .clip.selected { border-color: #4a9eff; box-shadow: 0 0 10px #4a9eff; }
  .clip-label {
    padding: 5px;
    font-size: 11px;
    white-space: nowrap;
    overflow: hidden;
    text-overflow: ellipsis;
  }
  .time-ruler {
    height: 30px;
    background: #1a1a1a;
    border-bottom: 1px solid #555;
    position: relative;
    margin-bottom: 10px;
  }
  .time-marker { position: absolute; bottom: 0; font-size: 10px; color: #888; }
  .time-line { position: absolute; bottom: 0; width: 1px; height: 10px; background: #555; }
  .clip-type-camera { background: #4a9eff; }
  .clip-type-action { background: #5cb85c; }
  .clip-type-audio { background: #f0ad4e; }
  .clip-type-event { background: #d9534f; }
  .clip-type-effect { background: #9b59b6; }
  .clip-type-default { background: #777; }
</style>
<script src="qrc:///qtwebchannel/qwebchannel.js"></script>
</head>
<body>
<div class="time-ruler" id="time-ruler"></div>
<div id="timeline-container"></div>
<script>
  const timelineData = @DATA@;
  const pixelsPerSecond = @PPS@;
  const minClipWidth = @MIN_WIDTH@;
  let bridge = null;

  function clipById(id) {
    return timelineData.clips.find(c => c.id === id);
  }

  function createClip(clip) {
    const el = document.createElement('div');
    el.className = 'clip clip-type-' + (clip.type || 'default');
    if (clip.selected) {
      el.classList.add('selected');
    }
    el.dataset.clipId = clip.id;
    el.style.left = (clip.start_time * pixelsPerSecond) + 'px';
    el.style.width = Math.max(clip.duration * pixelsPerSecond, minClipWidth) + 'px';

    const label = document.createElement('div');
    label.className = 'clip-label';
    label.textContent = clip.name;
    el.appendChild(label);

    el.onclick = () => selectClip(clip.id);
    return el;
  }

  function selectClip(id) {
    document.querySelectorAll('.clip').forEach(el => el.classList.remove('selected'));
    const el = document.querySelector('[data-clip-id="' + id + '"]');
    if (el) {
      el.classList.add('selected');
    }
    if (bridge) {
      bridge.clipSelected(String(id));
    }
  }

  function renderTracks() {
    const container = document.getElementById('timeline-container');
    container.innerHTML = '';
    timelineData.tracks.forEach(track => {
      const row = document.createElement('div');
      row.className = 'track';
      const label = document.createElement('div');
      label.className = 'track-label';
      label.textContent = track.name;
      row.appendChild(label);
      track.clips.forEach(id => {
        const clip = clipById(id);
        if (clip) {
          row.appendChild(createClip(clip));
        }
      });
      container.appendChild(row);
    });
  }

  function renderRuler() {
    const ruler = document.getElementById('time-ruler');
    ruler.innerHTML = '';
    const r = timelineData.ruler;
    const steps = Math.floor(r.max_time / r.minor + 1e-9);
    for (let i = 0; i <= steps; ++i) {
      const t = i * r.minor;
      const marker = document.createElement('div');
      marker.className = 'time-line';
      marker.style.left = (t * pixelsPerSecond) + 'px';
      const ratio = t / r.major;
      if (Math.abs(ratio - Math.round(ratio)) < 1e-6) {
        marker.style.height = '20px';
        const label = document.createElement('div');
        label.className = 'time-marker';
        label.style.left = (t * pixelsPerSecond + 5) + 'px';
        label.textContent = (Math.round(t * 100) / 100) + 's';
        ruler.appendChild(label);
      }
      ruler.appendChild(marker);
    }
  }

  renderTracks();
  renderRuler();

  if (typeof qt !== 'undefined' && qt.webChannelTransport) {
    new QWebChannel(qt.webChannelTransport, channel => {
      bridge = channel.objects.@BRIDGE@;
    });
  }
</script>
</body>
</html>
)HTML";

} // namespace

QString TimelineHtmlBuilder::build(const QJsonObject& data, double pixelsPerSecond,
                                   const TimelineViewSettings& settings) {
  // Escape "</" so a clip named "</script>" cannot end the script block
  QString json = QString::fromUtf8(QJsonDocument(data).toJson(QJsonDocument::Compact));
  json.replace(QStringLiteral("</"), QStringLiteral("<\\/"));

  QString page = QString::fromUtf8(kPageTemplate);
  page.replace(QStringLiteral("@PPS@"), QString::number(pixelsPerSecond, 'g', 10));
  page.replace(QStringLiteral("@MIN_WIDTH@"), QString::number(settings.minClipWidthPx));
  page.replace(QStringLiteral("@BRIDGE@"), QString::fromLatin1(BRIDGE_OBJECT_NAME));
  // Payload last, clip names may contain the other placeholders
  page.replace(QStringLiteral("@DATA@"), json);
  return page;
}

} // namespace EvflEditor::editor
