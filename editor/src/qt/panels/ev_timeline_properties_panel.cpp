#include "EvflEditor/editor/qt/panels/ev_timeline_properties_panel.hpp"

#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>

namespace EvflEditor::editor::qt {

EVTimelinePropertiesPanel::EVTimelinePropertiesPanel(QWidget *parent)
    : QWidget(parent) {
  setObjectName("EVTimelinePropertiesPanel");
  buildUi();
  setEnabled(false);
}

void EVTimelinePropertiesPanel::buildUi() {
  auto *layout = new QFormLayout(this);

  auto *title = new QLabel(tr("<b>Clip Properties</b>"), this);
  layout->addRow(title);

  m_nameEdit = new QLineEdit(this);
  m_nameEdit->setPlaceholderText(tr("Clip name"));
  layout->addRow(tr("Name:"), m_nameEdit);

  m_startSpin = new QDoubleSpinBox(this);
  m_startSpin->setRange(TimelineDocument::MIN_START_TIME,
                        TimelineDocument::MAX_TIME);
  m_startSpin->setDecimals(2);
  m_startSpin->setSuffix(tr(" sec"));
  layout->addRow(tr("Start Time:"), m_startSpin);

  m_durationSpin = new QDoubleSpinBox(this);
  m_durationSpin->setRange(TimelineDocument::MIN_DURATION,
                           TimelineDocument::MAX_TIME);
  m_durationSpin->setDecimals(2);
  m_durationSpin->setSuffix(tr(" sec"));
  layout->addRow(tr("Duration:"), m_durationSpin);

  m_typeCombo = new QComboBox(this);
  for (flow::ClipType type : flow::kAllClipTypes) {
    m_typeCombo->addItem(QString::fromLatin1(flow::clipTypeToString(type)),
                         static_cast<int>(type));
  }
  layout->addRow(tr("Type:"), m_typeCombo);

  auto *buttons = new QHBoxLayout();
  m_saveButton = new QPushButton(tr("Save Changes"), this);
  m_cancelButton = new QPushButton(tr("Cancel"), this);
  buttons->addWidget(m_saveButton);
  buttons->addWidget(m_cancelButton);
  layout->addRow(buttons);

  connect(m_saveButton, &QPushButton::clicked, this,
          &EVTimelinePropertiesPanel::saveRequested);
  connect(m_cancelButton, &QPushButton::clicked, this,
          &EVTimelinePropertiesPanel::cancelChanges);
}

void EVTimelinePropertiesPanel::loadClip(const flow::Clip &clip) {
  m_loadedClip = clip;
  m_nameEdit->setText(QString::fromStdString(clip.name));
  m_startSpin->setValue(clip.startTime);
  m_durationSpin->setValue(clip.duration);
  const int typeIndex = m_typeCombo->findData(static_cast<int>(clip.type));
  m_typeCombo->setCurrentIndex(typeIndex >= 0 ? typeIndex : 0);
  setEnabled(true);
}

void EVTimelinePropertiesPanel::clear() {
  m_loadedClip.reset();
  m_nameEdit->clear();
  m_startSpin->setValue(0.0);
  m_durationSpin->setValue(1.0);
  m_typeCombo->setCurrentIndex(0);
  setEnabled(false);
}

ClipDraft EVTimelinePropertiesPanel::draft() const {
  ClipDraft draft;
  draft.name = m_nameEdit->text().toStdString();
  draft.startTime = m_startSpin->value();
  draft.duration = m_durationSpin->value();
  draft.type = static_cast<flow::ClipType>(m_typeCombo->currentData().toInt());
  return draft;
}

void EVTimelinePropertiesPanel::cancelChanges() {
  if (m_loadedClip) {
    const flow::Clip clip = *m_loadedClip;
    loadClip(clip);
  }
}

} // namespace EvflEditor::editor::qt
