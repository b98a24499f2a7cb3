#ifndef CUSTOMWIDGETS_H
#define CUSTOMWIDGETS_H

#include <QSlider>
#include <QPushButton>
#include <QPainter>
#include <QStyle>
#include <QStyleOptionSlider>

// A horizontal slider with blue styling
class BlueSlider : public QSlider {
    Q_OBJECT
public:
    BlueSlider(int minimum, int maximum, int value, QWidget* parent = nullptr);
};

// Refractive index slider; the integer position is 100 * n
class IndexSlider : public BlueSlider {
    Q_OBJECT
public:
    explicit IndexSlider(double n, QWidget* parent = nullptr);

    double index() const;
    // Moves the handle without emitting indexChanged
    void showIndex(double n);

    static int positionForIndex(double n);
    static double indexForPosition(int position);

signals:
    void indexChanged(double n);
};

// Wavelength slider whose groove shows the visible spectrum
class SpectrumSlider : public QSlider {
    Q_OBJECT
public:
    explicit SpectrumSlider(QWidget* parent = nullptr);

protected:
    void paintEvent(QPaintEvent* event) override;
};

// A play/pause button that toggles state
class PlayPauseButton : public QPushButton {
    Q_OBJECT
public:
    PlayPauseButton(QWidget* parent = nullptr);
    bool isPaused() const;

signals:
    void pausedChanged(bool paused);

private:
    void updateIcon();

    bool m_paused;
};

#endif // CUSTOMWIDGETS_H
