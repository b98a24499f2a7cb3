#include "../Header/CustomWidgets.h"
#include "../Header/ColorUtils.h"

#include <QSignalBlocker>

#include <cmath>

namespace {

const char* const kBlueSliderStyle =
    "QSlider::groove:horizontal {"
    "    border: none;"
    "    height: 10px;"
    "    background: #333337;"
    "    border-radius: 5px;"
    "}"
    "QSlider::sub-page:horizontal {"
    "    background: #0088ff;"
    "    border-radius: 5px;"
    "}"
    "QSlider::handle:horizontal {"
    "    background: white;"
    "    width: 18px;"
    "    margin: -4px 0;"
    "    border-radius: 9px;"
    "}";

const char* const kRoundButtonStyle =
    "QPushButton {"
    "    background-color: #007ACC;"
    "    border-radius: 20px;"
    "    color: white;"
    "    font-size: 16px;"
    "    font-weight: bold;"
    "}"
    "QPushButton:hover {"
    "    background-color: #1C97EA;"
    "}";

constexpr double kIndexSliderScale = 100.0;

} // namespace

BlueSlider::BlueSlider(int minimum, int maximum, int value, QWidget* parent)
    : QSlider(Qt::Horizontal, parent) {
    setRange(minimum, maximum);
    setValue(value);
    setStyleSheet(QString::fromLatin1(kBlueSliderStyle));
}

IndexSlider::IndexSlider(double n, QWidget* parent)
    : BlueSlider(100, 300, positionForIndex(n), parent) {
    connect(this, &QSlider::valueChanged, this, [this](int position) {
        emit indexChanged(indexForPosition(position));
    });
}

double IndexSlider::index() const {
    return indexForPosition(value());
}

void IndexSlider::showIndex(double n) {
    const QSignalBlocker blocker(this);
    setValue(positionForIndex(n));
}

int IndexSlider::positionForIndex(double n) {
    return static_cast<int>(std::lround(n * kIndexSliderScale));
}

double IndexSlider::indexForPosition(int position) {
    return position / kIndexSliderScale;
}

SpectrumSlider::SpectrumSlider(QWidget* parent) : QSlider(Qt::Horizontal, parent) {
    setRange(static_cast<int>(kVisibleMin), static_cast<int>(kVisibleMax));
    setTickPosition(QSlider::TicksBelow);
    setTickInterval(50);
}

void SpectrumSlider::paintEvent(QPaintEvent* event) {
    QSlider::paintEvent(event);

    QPainter painter(this);
    QStyleOptionSlider opt;
    initStyleOption(&opt);

    QRect groove = style()->subControlRect(QStyle::CC_Slider, &opt, QStyle::SC_SliderGroove, this);

    // Sample the same mapping the curves use, so the groove matches the wave colour
    QLinearGradient gradient(groove.left(), 0, groove.right(), 0);
    const int stops = 16;
    for (int i = 0; i <= stops; ++i) {
        const double t = static_cast<double>(i) / stops;
        gradient.setColorAt(t, wavelengthToRGB(minimum() + t * (maximum() - minimum())));
    }
    painter.fillRect(groove, gradient);

    QRect handle = style()->subControlRect(QStyle::CC_Slider, &opt, QStyle::SC_SliderHandle, this);
    painter.setPen(Qt::black);
    painter.setBrush(QColor(0, 122, 204));
    painter.drawRoundedRect(handle, 3, 3);
}

PlayPauseButton::PlayPauseButton(QWidget* parent) : QPushButton(parent), m_paused(false) {
    setFixedSize(40, 40);
    setStyleSheet(QString::fromLatin1(kRoundButtonStyle));
    updateIcon();
    connect(this, &QPushButton::clicked, this, [this]() {
        m_paused = !m_paused;
        updateIcon();
        emit pausedChanged(m_paused);
    });
}

bool PlayPauseButton::isPaused() const {
    return m_paused;
}

void PlayPauseButton::updateIcon() {
    setText(m_paused ? QStringLiteral("▶") : QStringLiteral("❚❚"));
}
