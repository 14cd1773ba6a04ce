#include "preferencesdialog.h"
#include "blinkreadersettings.h"

#include <KLocalizedString>

#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QLabel>
#include <QSpinBox>
#include <QVBoxLayout>

BlinkReaderConfigDialog::BlinkReaderConfigDialog(QWidget *parent,
                                                 const QStringList &fontFamilies)
    : KConfigDialog(parent, QStringLiteral("settings"), BlinkReaderSettings::self())
{
    // ===== Reading Page =====
    auto *readingPage = new QWidget;
    auto *readingLayout = new QVBoxLayout(readingPage);

    auto *speedGroup = new QGroupBox(i18n("Speed"));
    auto *speedForm = new QFormLayout(speedGroup);

    auto *defaultWpm = new QSpinBox;
    defaultWpm->setObjectName(QStringLiteral("kcfg_DefaultWpm"));
    defaultWpm->setRange(1, 5000);
    defaultWpm->setSuffix(i18n(" wpm"));
    speedForm->addRow(i18n("Default speed:"), defaultWpm);

    auto *minWpm = new QSpinBox;
    minWpm->setObjectName(QStringLiteral("kcfg_MinWpm"));
    minWpm->setRange(1, 5000);
    minWpm->setSuffix(i18n(" wpm"));
    speedForm->addRow(i18n("Slowest:"), minWpm);

    auto *maxWpm = new QSpinBox;
    maxWpm->setObjectName(QStringLiteral("kcfg_MaxWpm"));
    maxWpm->setRange(1, 5000);
    maxWpm->setSuffix(i18n(" wpm"));
    speedForm->addRow(i18n("Fastest:"), maxWpm);

    auto *wpmStep = new QSpinBox;
    wpmStep->setObjectName(QStringLiteral("kcfg_WpmStep"));
    wpmStep->setRange(1, 500);
    wpmStep->setSuffix(i18n(" wpm"));
    speedForm->addRow(i18n("Speed step:"), wpmStep);

    readingLayout->addWidget(speedGroup);

    auto *navGroup = new QGroupBox(i18n("Navigation"));
    auto *navForm = new QFormLayout(navGroup);
    auto *skipAmount = new QSpinBox;
    skipAmount->setObjectName(QStringLiteral("kcfg_SkipAmount"));
    skipAmount->setRange(1, 100);
    skipAmount->setSuffix(i18n(" words"));
    navForm->addRow(i18n("Skip by:"), skipAmount);
    readingLayout->addWidget(navGroup);
    readingLayout->addStretch();

    addPage(readingPage, i18n("Reading"), QStringLiteral("media-playback-start"));

    // ===== Display Page =====
    auto *displayPage = new QWidget;
    auto *displayForm = new QFormLayout(displayPage);

    m_fontCombo = new QComboBox;
    m_fontCombo->addItems(fontFamilies);
    displayForm->addRow(i18n("Default font:"), m_fontCombo);
    connect(m_fontCombo, &QComboBox::currentIndexChanged,
            this, &BlinkReaderConfigDialog::updateButtons);

    auto *fontSize = new QDoubleSpinBox;
    fontSize->setObjectName(QStringLiteral("kcfg_DefaultFontSize"));
    fontSize->setRange(8, 200);
    fontSize->setDecimals(0);
    fontSize->setSuffix(i18n(" pt"));
    displayForm->addRow(i18n("Default font size:"), fontSize);

    auto *frameInterval = new QSpinBox;
    frameInterval->setObjectName(QStringLiteral("kcfg_FrameInterval"));
    frameInterval->setRange(1, 100);
    frameInterval->setSuffix(i18n(" ms"));
    displayForm->addRow(i18n("Frame interval:"), frameInterval);

    addPage(displayPage, i18n("Display"), QStringLiteral("preferences-desktop-display"));

    // ===== Session Page =====
    auto *sessionPage = new QWidget;
    auto *sessionLayout = new QVBoxLayout(sessionPage);
    auto *sessionForm = new QFormLayout;

    auto *backendCombo = new QComboBox;
    backendCombo->setObjectName(QStringLiteral("kcfg_StorageBackend"));
    backendCombo->addItem(i18n("Files in the data folder"));
    backendCombo->addItem(i18n("Single configuration file"));
    sessionForm->addRow(i18n("Store tabs in:"), backendCombo);

    auto *autosave = new QSpinBox;
    autosave->setObjectName(QStringLiteral("kcfg_AutosaveInterval"));
    autosave->setRange(1, 3600);
    autosave->setSuffix(i18n(" s"));
    sessionForm->addRow(i18n("Autosave every:"), autosave);
    sessionLayout->addLayout(sessionForm);

    auto *note = new QLabel(i18n("A new storage location takes effect on the next start."));
    note->setWordWrap(true);
    sessionLayout->addWidget(note);
    sessionLayout->addStretch();

    addPage(sessionPage, i18n("Session"), QStringLiteral("document-save"));
}

void BlinkReaderConfigDialog::updateWidgets()
{
    const QString saved = BlinkReaderSettings::self()->defaultFontFamily();
    const int index = m_fontCombo->findText(saved);
    m_fontCombo->setCurrentIndex(index >= 0 ? index : 0);
}

void BlinkReaderConfigDialog::updateSettings()
{
    BlinkReaderSettings::self()->setDefaultFontFamily(m_fontCombo->currentText());
    BlinkReaderSettings::self()->save();
}

bool BlinkReaderConfigDialog::hasChanged()
{
    return m_fontCombo->currentText() != BlinkReaderSettings::self()->defaultFontFamily();
}
