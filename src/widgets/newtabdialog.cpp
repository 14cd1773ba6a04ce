#include "newtabdialog.h"

#include <KLocalizedString>

#include <QDialogButtonBox>
#include <QDir>
#include <QFileDialog>
#include <QFormLayout>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QVBoxLayout>

NewTabDialog::NewTabDialog(const QString &fileFilter, QWidget *parent)
    : QDialog(parent)
    , m_fileFilter(fileFilter)
{
    setWindowTitle(i18n("New Tab"));

    auto *layout = new QVBoxLayout(this);

    auto *form = new QFormLayout;
    m_nameEdit = new QLineEdit(this);
    m_nameEdit->setPlaceholderText(i18n("Automatic"));
    form->addRow(i18n("Name:"), m_nameEdit);
    layout->addLayout(form);

    m_textEdit = new QPlainTextEdit(this);
    m_textEdit->setPlaceholderText(i18n("Paste the text to read here"));
    layout->addWidget(m_textEdit, 1);

    m_buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    auto *openButton = m_buttons->addButton(i18n("Open File..."), QDialogButtonBox::ActionRole);
    openButton->setIcon(QIcon::fromTheme(QStringLiteral("document-open")));
    layout->addWidget(m_buttons);

    connect(m_buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(m_buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(openButton, &QPushButton::clicked, this, &NewTabDialog::chooseFile);
    connect(m_textEdit, &QPlainTextEdit::textChanged, this, &NewTabDialog::updateOkButton);

    updateOkButton();
    resize(560, 400);
}

QString NewTabDialog::tabName() const
{
    return m_nameEdit->text().trimmed();
}

QString NewTabDialog::text() const
{
    return m_textEdit->toPlainText();
}

void NewTabDialog::chooseFile()
{
    const QString path = QFileDialog::getOpenFileName(
        this, i18n("Open File"), QDir::homePath(), m_fileFilter);
    if (path.isEmpty())
        return;
    m_filePath = path;
    accept();
}

void NewTabDialog::updateOkButton()
{
    m_buttons->button(QDialogButtonBox::Ok)->setEnabled(!text().trimmed().isEmpty());
}
