#include "homeview.h"

#include <KLocalizedString>

#include <QHBoxLayout>
#include <QIcon>
#include <QLabel>
#include <QPushButton>
#include <QVBoxLayout>

HomeView::HomeView(QWidget *parent)
    : QWidget(parent)
{
    auto *layout = new QVBoxLayout(this);
    layout->addStretch();

    auto *title = new QLabel(i18n("<h1>BlinkReader</h1>"), this);
    title->setAlignment(Qt::AlignCenter);
    layout->addWidget(title);

    auto *intro = new QLabel(i18n("Read one word at a time. Paste some text or open a file to start."), this);
    intro->setAlignment(Qt::AlignCenter);
    intro->setWordWrap(true);
    layout->addWidget(intro);

    auto *buttons = new QHBoxLayout;
    buttons->addStretch();
    auto *pasteButton = new QPushButton(QIcon::fromTheme(QStringLiteral("tab-new")),
                                        i18n("New Tab from Text..."), this);
    connect(pasteButton, &QPushButton::clicked, this, &HomeView::newTabRequested);
    buttons->addWidget(pasteButton);
    auto *openButton = new QPushButton(QIcon::fromTheme(QStringLiteral("document-open")),
                                       i18n("Open File..."), this);
    connect(openButton, &QPushButton::clicked, this, &HomeView::openFileRequested);
    buttons->addWidget(openButton);
    buttons->addStretch();
    layout->addLayout(buttons);

    auto *keys = new QLabel(i18n("<p><b>Space</b> play/pause &nbsp; <b>Esc</b> stop &nbsp; "
                                 "<b>Left/Right</b> skip &nbsp; <b>Up/Down</b> speed &nbsp; "
                                 "<b>R</b> restart</p>"), this);
    keys->setAlignment(Qt::AlignCenter);
    layout->addWidget(keys);

    m_formatsLabel = new QLabel(this);
    m_formatsLabel->setAlignment(Qt::AlignCenter);
    m_formatsLabel->setForegroundRole(QPalette::PlaceholderText);
    layout->addWidget(m_formatsLabel);

    layout->addStretch();
}

void HomeView::setSupportedExtensions(const QStringList &extensions)
{
    QStringList patterns;
    for (const QString &ext : extensions)
        patterns << QLatin1Char('.') + ext;
    m_formatsLabel->setText(i18n("Supported files: %1", patterns.join(QStringLiteral(", "))));
}
