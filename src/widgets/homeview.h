#ifndef BLINKREADER_HOMEVIEW_H
#define BLINKREADER_HOMEVIEW_H

#include <QWidget>

class QLabel;

// Start page shown for the Home tab.
class HomeView : public QWidget
{
    Q_OBJECT

public:
    explicit HomeView(QWidget *parent = nullptr);

    void setSupportedExtensions(const QStringList &extensions);

Q_SIGNALS:
    void newTabRequested();
    void openFileRequested();

private:
    QLabel *m_formatsLabel = nullptr;
};

#endif // BLINKREADER_HOMEVIEW_H
