/*
 * wordview.h — Paints the current word with a fixed fixation letter
 *
 * The pivot letter is centred on the widget; the text before it ends at
 * the pivot's left edge and the text after it starts at its right edge,
 * so the pivot stays put from one word to the next.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef BLINKREADER_WORDVIEW_H
#define BLINKREADER_WORDVIEW_H

#include <QWidget>

class WordDisplayModel;

class WordView : public QWidget
{
    Q_OBJECT

public:
    explicit WordView(WordDisplayModel *model, QWidget *parent = nullptr);

    void setPlaceholderText(const QString &text);

    QSize sizeHint() const override;

protected:
    void paintEvent(QPaintEvent *event) override;

private:
    QFont displayFont() const;

    WordDisplayModel *m_model;
    QString m_placeholder;
};

#endif // BLINKREADER_WORDVIEW_H
