#pragma once

/**
 * @file ev_dialogs_detail.hpp
 * @brief Shared look and button layout for editor dialogs
 */

#include <QString>

class QDialog;
class QHBoxLayout;
class QPushButton;
class QWidget;

namespace EvflEditor::editor::qt::detail {

void applyDialogFrameStyle(QDialog* dialog);

/**
 * @brief Button row with the secondary button left of the primary one
 */
QHBoxLayout* createStandardButtonBar(const QString& primaryText, const QString& secondaryText,
                                     QPushButton** outPrimary, QPushButton** outSecondary,
                                     QWidget* parent);

constexpr int DIALOG_MIN_WIDTH = 400;
constexpr int DIALOG_BUTTON_MIN_WIDTH = 80;
constexpr int DIALOG_BUTTON_HEIGHT = 32;
constexpr int DIALOG_MARGIN = 16;
constexpr int DIALOG_SPACING = 12;

} // namespace EvflEditor::editor::qt::detail
