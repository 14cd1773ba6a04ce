#ifndef BLINKREADER_CONTROLBAR_H
#define BLINKREADER_CONTROLBAR_H

#include <QWidget>

#include "fontsettings.h"
#include "readerlimits.h"
#include "readingstatemachine.h"

class QAction;
class QComboBox;
class QDoubleSpinBox;
class QLabel;
class QProgressBar;
class QSpinBox;
class QToolBar;

class ControlBar : public QWidget
{
    Q_OBJECT

public:
    explicit ControlBar(QWidget *parent = nullptr);

    // Transport buttons, in order.
    void setActions(const QList<QAction *> &actions);

    void setFontFamilies(const QStringList &families);
    void setLimits(const ReaderLimits &limits);

public Q_SLOTS:
    void setState(ReadingStateMachine::State state);
    void setWpm(int wpm);
    void setProgress(int position, int count);
    void setFontSettings(const FontSettings &font);
    void setReaderEnabled(bool enabled);

Q_SIGNALS:
    void wpmEdited(int wpm);
    void fontEdited(const FontSettings &font);

private:
    void emitFont();

    QToolBar *m_transport = nullptr;
    QLabel *m_stateLabel = nullptr;
    QProgressBar *m_progressBar = nullptr;
    QLabel *m_positionLabel = nullptr;
    QSpinBox *m_wpmSpin = nullptr;
    QComboBox *m_fontCombo = nullptr;
    QDoubleSpinBox *m_sizeSpin = nullptr;
};

#endif // BLINKREADER_CONTROLBAR_H
