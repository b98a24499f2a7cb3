#ifndef LIGHTSIMULATIONAPP_H
#define LIGHTSIMULATIONAPP_H

#include <QMainWindow>
#include <QCheckBox>
#include <QComboBox>
#include <QLabel>
#include <QHBoxLayout>

#include <array>

#include "AnimationDriver.h"
#include "AppConfig.h"
#include "CustomWidgets.h"
#include "WaveSimulationWidget.h"

// Main application window. Owns the simulation parameters and the animation
// driver; every control writes through a parameter setter.
class LightSimulationApp : public QMainWindow {
    Q_OBJECT
public:
    explicit LightSimulationApp(const AppConfig& config, QWidget* parent = nullptr);

private slots:
    void update_wavelength(int value);
    void update_amplitude(int value);
    void update_speed(int value);
    void update_zoom(int value);
    void update_index(int slot, double n);
    void update_medium(int slot, const QString& medium_name);
    void toggle_dispersion(bool enabled);
    void toggle_white_light(bool enabled);
    void toggle_pause(bool paused);
    void apply_scenario();

private:
    void setup_wave_controls(QHBoxLayout* layout);
    void setup_medium_controls(QHBoxLayout* layout, int slot);
    void refresh();

    SimulationParameters params;
    MediumSelection media;
    AnimationDriver* driver;

    WaveSimulationWidget* wave_widget;
    PlayPauseButton* play_pause_button;

    SpectrumSlider* wavelength_slider;
    QLabel* wavelength_value;
    BlueSlider* amplitude_slider;
    QLabel* amplitude_value;
    BlueSlider* speed_slider;
    QLabel* speed_value;
    BlueSlider* zoom_slider;
    QLabel* zoom_value;
    QCheckBox* dispersion_check;
    QCheckBox* white_light_check;

    std::array<QComboBox*, 3> medium_combos;
    std::array<IndexSlider*, 3> index_sliders;
    std::array<QLabel*, 3> index_values;

    QComboBox* scenario_combo;
};

#endif // LIGHTSIMULATIONAPP_H
