#ifndef BLINKREADER_NEWTABDIALOG_H
#define BLINKREADER_NEWTABDIALOG_H

#include <QDialog>

class QDialogButtonBox;
class QLineEdit;
class QPlainTextEdit;

// Collects the source of a new tab: pasted text, or a file picked with
// the "Open File..." button (which accepts the dialog immediately).
class NewTabDialog : public QDialog
{
    Q_OBJECT

public:
    NewTabDialog(const QString &fileFilter, QWidget *parent = nullptr);

    QString tabName() const;
    QString text() const;

    /// Non-empty when a file was chosen instead of text.
    QString filePath() const { return m_filePath; }

private:
    void chooseFile();
    void updateOkButton();

    QString m_fileFilter;
    QString m_filePath;
    QLineEdit *m_nameEdit = nullptr;
    QPlainTextEdit *m_textEdit = nullptr;
    QDialogButtonBox *m_buttons = nullptr;
};

#endif // BLINKREADER_NEWTABDIALOG_H
