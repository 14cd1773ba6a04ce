#include "wordview.h"
#include "worddisplaymodel.h"

#include <QFontMetricsF>
#include <QPainter>
#include <QPalette>
#include <QtMath>

WordView::WordView(WordDisplayModel *model, QWidget *parent)
    : QWidget(parent)
    , m_model(model)
{
    setAutoFillBackground(true);
    setBackgroundRole(QPalette::Base);
    setFocusPolicy(Qt::StrongFocus);

    connect(m_model, &WordDisplayModel::contentChanged, this, qOverload<>(&QWidget::update));
    connect(m_model, &WordDisplayModel::geometryChanged, this, [this]() {
        updateGeometry();
        update();
    });
}

void WordView::setPlaceholderText(const QString &text)
{
    m_placeholder = text;
    update();
}

QSize WordView::sizeHint() const
{
    const QFontMetricsF fm(displayFont());
    return QSize(640, qCeil(fm.height() * 3));
}

QFont WordView::displayFont() const
{
    QFont font = this->font();
    const FontSettings &settings = m_model->font();
    if (!settings.family.isEmpty())
        font.setFamily(settings.family);
    if (settings.pointSize > 0)
        font.setPointSizeF(settings.pointSize);
    return font;
}

void WordView::paintEvent(QPaintEvent *)
{
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);
    p.setRenderHint(QPainter::TextAntialiasing);

    const QRectF area = rect();
    const QPointF centre = area.center();

    if (m_model->isEmpty()) {
        if (!m_placeholder.isEmpty()) {
            p.setPen(palette().color(QPalette::PlaceholderText));
            p.drawText(area, Qt::AlignCenter | Qt::TextWordWrap, m_placeholder);
        }
        return;
    }

    const QFont font = displayFont();
    p.setFont(font);
    const QFontMetricsF fm(font);
    const WordTiming::FixationSplit &split = m_model->segments();

    const qreal pivotWidth = fm.horizontalAdvance(split.pivot);
    const qreal pivotLeft = centre.x() - pivotWidth / 2.0;
    const qreal baseline = centre.y() + (fm.ascent() - fm.descent()) / 2.0;

    // Reticle: ticks above and below the fixation point
    const qreal gap = fm.height() * 0.15;
    const qreal tick = fm.height() * 0.25;
    const qreal top = baseline - fm.ascent() - gap;
    const qreal bottom = baseline + fm.descent() + gap;
    QPen reticle(palette().color(QPalette::Mid));
    reticle.setWidthF(qMax(1.0, m_model->halfCharWidth() / 8.0));
    p.setPen(reticle);
    p.drawLine(QPointF(area.left(), top), QPointF(area.right(), top));
    p.drawLine(QPointF(area.left(), bottom), QPointF(area.right(), bottom));
    p.drawLine(QPointF(centre.x(), top), QPointF(centre.x(), top + tick));
    p.drawLine(QPointF(centre.x(), bottom), QPointF(centre.x(), bottom - tick));

    p.setPen(palette().color(QPalette::Text));
    if (!split.before.isEmpty()) {
        const qreal w = fm.horizontalAdvance(split.before);
        p.drawText(QPointF(pivotLeft - w, baseline), split.before);
    }
    if (!split.after.isEmpty())
        p.drawText(QPointF(pivotLeft + pivotWidth, baseline), split.after);

    p.setPen(QColor(0xd0, 0x30, 0x30));
    p.drawText(QPointF(pivotLeft, baseline), split.pivot);
}
