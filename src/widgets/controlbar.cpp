#include "controlbar.h"

#include <KLocalizedString>

#include <QComboBox>
#include <QDoubleSpinBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QProgressBar>
#include <QSignalBlocker>
#include <QSpinBox>
#include <QToolBar>

ControlBar::ControlBar(QWidget *parent)
    : QWidget(parent)
{
    auto *layout = new QHBoxLayout(this);
    layout->setContentsMargins(6, 2, 6, 2);

    m_transport = new QToolBar(this);
    m_transport->setIconSize(QSize(16, 16));
    m_transport->setToolButtonStyle(Qt::ToolButtonIconOnly);
    layout->addWidget(m_transport);

    m_stateLabel = new QLabel(this);
    m_stateLabel->setMinimumWidth(60);
    layout->addWidget(m_stateLabel);

    m_progressBar = new QProgressBar(this);
    m_progressBar->setTextVisible(false);
    m_progressBar->setMaximumHeight(8);
    layout->addWidget(m_progressBar, 1);

    m_positionLabel = new QLabel(this);
    layout->addWidget(m_positionLabel);

    layout->addSpacing(12);

    m_wpmSpin = new QSpinBox(this);
    m_wpmSpin->setSuffix(i18n(" wpm"));
    m_wpmSpin->setToolTip(i18n("Reading speed"));
    m_wpmSpin->setFocusPolicy(Qt::ClickFocus);
    layout->addWidget(m_wpmSpin);

    m_fontCombo = new QComboBox(this);
    m_fontCombo->setToolTip(i18n("Font"));
    m_fontCombo->setFocusPolicy(Qt::ClickFocus);
    layout->addWidget(m_fontCombo);

    m_sizeSpin = new QDoubleSpinBox(this);
    m_sizeSpin->setRange(8, 200);
    m_sizeSpin->setDecimals(0);
    m_sizeSpin->setSuffix(i18n(" pt"));
    m_sizeSpin->setToolTip(i18n("Font size"));
    m_sizeSpin->setFocusPolicy(Qt::ClickFocus);
    layout->addWidget(m_sizeSpin);

    setLimits(ReaderLimits());
    setState(ReadingStateMachine::State::Idle);
    setProgress(0, 0);

    connect(m_wpmSpin, qOverload<int>(&QSpinBox::valueChanged), this, &ControlBar::wpmEdited);
    connect(m_fontCombo, &QComboBox::currentTextChanged, this, &ControlBar::emitFont);
    connect(m_sizeSpin, qOverload<double>(&QDoubleSpinBox::valueChanged), this, &ControlBar::emitFont);
}

void ControlBar::setActions(const QList<QAction *> &actions)
{
    m_transport->clear();
    m_transport->addActions(actions);
}

void ControlBar::setFontFamilies(const QStringList &families)
{
    const QSignalBlocker blocker(m_fontCombo);
    const QString current = m_fontCombo->currentText();
    m_fontCombo->clear();
    m_fontCombo->addItems(families);
    m_fontCombo->setCurrentText(current);
}

void ControlBar::setLimits(const ReaderLimits &limits)
{
    const QSignalBlocker blocker(m_wpmSpin);
    m_wpmSpin->setRange(limits.minWpm, limits.maxWpm);
    m_wpmSpin->setSingleStep(limits.wpmStep);
}

void ControlBar::setState(ReadingStateMachine::State state)
{
    switch (state) {
    case ReadingStateMachine::State::Idle:
        m_stateLabel->setText(i18n("Stopped"));
        break;
    case ReadingStateMachine::State::Playing:
        m_stateLabel->setText(i18n("Playing"));
        break;
    case ReadingStateMachine::State::Paused:
        m_stateLabel->setText(i18n("Paused"));
        break;
    }
}

void ControlBar::setWpm(int wpm)
{
    const QSignalBlocker blocker(m_wpmSpin);
    m_wpmSpin->setValue(wpm);
}

void ControlBar::setProgress(int position, int count)
{
    m_progressBar->setRange(0, qMax(0, count - 1));
    m_progressBar->setValue(qMax(0, position - 1));
    if (count > 0)
        m_positionLabel->setText(i18nc("word position", "%1 / %2", position, count));
    else
        m_positionLabel->clear();
}

void ControlBar::setFontSettings(const FontSettings &font)
{
    const QSignalBlocker comboBlocker(m_fontCombo);
    const QSignalBlocker sizeBlocker(m_sizeSpin);
    m_fontCombo->setCurrentText(font.family);
    m_sizeSpin->setValue(font.pointSize);
}

void ControlBar::setReaderEnabled(bool enabled)
{
    m_wpmSpin->setEnabled(enabled);
    m_fontCombo->setEnabled(enabled);
    m_sizeSpin->setEnabled(enabled);
    if (!enabled)
        setProgress(0, 0);
}

void ControlBar::emitFont()
{
    FontSettings font;
    font.family = m_fontCombo->currentText();
    font.pointSize = m_sizeSpin->value();
    Q_EMIT fontEdited(font);
}
