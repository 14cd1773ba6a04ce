#ifndef BLINKREADER_PREFERENCESDIALOG_H
#define BLINKREADER_PREFERENCESDIALOG_H

#include <KConfigDialog>

class QComboBox;

class BlinkReaderConfigDialog : public KConfigDialog
{
    Q_OBJECT

public:
    BlinkReaderConfigDialog(QWidget *parent, const QStringList &fontFamilies);

protected:
    void updateWidgets() override;
    void updateSettings() override;
    bool hasChanged() override;

private:
    QComboBox *m_fontCombo;
};

#endif // BLINKREADER_PREFERENCESDIALOG_H
