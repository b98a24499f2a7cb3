#include "../Header/LightSimulationApp.h"
#include "../Header/Logging.h"

#include <QGroupBox>
#include <QPushButton>
#include <QSignalBlocker>
#include <QVBoxLayout>

namespace {

const char* const kDarkStyle =
    "QMainWindow, QWidget {"
    "    background-color: #2D2D30;"
    "    color: #FFFFFF;"
    "}"
    "QGroupBox {"
    "    border: 1px solid #3F3F46;"
    "    border-radius: 5px;"
    "    margin-top: 10px;"
    "    font-weight: bold;"
    "}"
    "QGroupBox::title {"
    "    subcontrol-origin: margin;"
    "    left: 10px;"
    "    padding: 0 5px 0 5px;"
    "}"
    "QComboBox {"
    "    background-color: #333337;"
    "    border: 1px solid #3F3F46;"
    "    border-radius: 3px;"
    "    padding: 2px;"
    "}";

QHBoxLayout* labelledRow(const QString& caption, QWidget* control, QLabel* value) {
    QHBoxLayout* row = new QHBoxLayout();
    row->addWidget(new QLabel(caption));
    row->addWidget(control, 1);
    row->addWidget(value);
    return row;
}

} // namespace

LightSimulationApp::LightSimulationApp(const AppConfig& config, QWidget* parent)
    : QMainWindow(parent), params(config.params), media(config.media) {
    setWindowTitle("Light Wave Refraction Simulation");
    setStyleSheet(QString::fromLatin1(kDarkStyle));

    QWidget* central_widget = new QWidget(this);
    setCentralWidget(central_widget);
    QVBoxLayout* main_layout = new QVBoxLayout(central_widget);

    wave_widget = new WaveSimulationWidget();
    wave_widget->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
    main_layout->addWidget(wave_widget, 1);

    play_pause_button = new PlayPauseButton();
    QHBoxLayout* button_layout = new QHBoxLayout();
    button_layout->addStretch(1);
    button_layout->addWidget(play_pause_button);
    button_layout->addStretch(1);
    main_layout->addLayout(button_layout);

    QWidget* controls_container = new QWidget();
    controls_container->setMaximumHeight(220);
    QHBoxLayout* controls_layout = new QHBoxLayout(controls_container);
    controls_layout->setSpacing(10);
    main_layout->addWidget(controls_container);

    setup_wave_controls(controls_layout);
    for (int slot = 1; slot <= 3; ++slot) {
        setup_medium_controls(controls_layout, slot);
    }

    QGroupBox* scenario_group = new QGroupBox("Presets");
    QVBoxLayout* scenario_layout = new QVBoxLayout(scenario_group);
    scenario_combo = new QComboBox();
    for (const Scenario& scenario : scenarioPresets()) {
        scenario_combo->addItem(scenario.name);
    }
    scenario_layout->addWidget(scenario_combo);
    QPushButton* apply_button = new QPushButton("Apply Preset");
    scenario_layout->addWidget(apply_button);
    controls_layout->addWidget(scenario_group);

    driver = new AnimationDriver(&params, this);
    connect(driver, &AnimationDriver::frameReady, wave_widget, &WaveSimulationWidget::showFrame);
    connect(play_pause_button, &PlayPauseButton::pausedChanged, this, &LightSimulationApp::toggle_pause);
    connect(apply_button, &QPushButton::clicked, this, &LightSimulationApp::apply_scenario);

    wave_widget->setWhiteLight(params.whiteLightEnabled);
    refresh();
    wave_widget->showFrame(driver->computeFrame());
    driver->start(config.tickIntervalMs);
}

void LightSimulationApp::setup_wave_controls(QHBoxLayout* layout) {
    QGroupBox* wave_group = new QGroupBox("Wave Properties");
    QVBoxLayout* wave_layout = new QVBoxLayout(wave_group);

    wavelength_slider = new SpectrumSlider();
    wavelength_slider->setValue(qRound(params.wavelength));
    wavelength_value = new QLabel(QString("%1 nm").arg(qRound(params.wavelength)));
    wave_layout->addLayout(labelledRow("Wavelength:", wavelength_slider, wavelength_value));

    amplitude_slider = new BlueSlider(1, 10, qRound(params.amplitude));
    amplitude_value = new QLabel(QString::number(params.amplitude));
    wave_layout->addLayout(labelledRow("Amplitude:", amplitude_slider, amplitude_value));

    speed_slider = new BlueSlider(1, 10, qRound(params.speed));
    speed_value = new QLabel(QString::number(params.speed));
    wave_layout->addLayout(labelledRow("Wave Speed:", speed_slider, speed_value));

    // Slider value / 10 is the zoom factor
    zoom_slider = new BlueSlider(1, 20, 10);
    zoom_value = new QLabel("1.0x");
    wave_layout->addLayout(labelledRow("Vertical Scale:", zoom_slider, zoom_value));

    QHBoxLayout* mode_layout = new QHBoxLayout();
    dispersion_check = new QCheckBox("Enable Dispersion");
    dispersion_check->setChecked(params.dispersionEnabled);
    white_light_check = new QCheckBox("White Light");
    white_light_check->setChecked(params.whiteLightEnabled);
    mode_layout->addWidget(dispersion_check);
    mode_layout->addWidget(white_light_check);
    wave_layout->addLayout(mode_layout);

    layout->addWidget(wave_group);

    connect(wavelength_slider, &QSlider::valueChanged, this, &LightSimulationApp::update_wavelength);
    connect(amplitude_slider, &QSlider::valueChanged, this, &LightSimulationApp::update_amplitude);
    connect(speed_slider, &QSlider::valueChanged, this, &LightSimulationApp::update_speed);
    connect(zoom_slider, &QSlider::valueChanged, this, &LightSimulationApp::update_zoom);
    connect(dispersion_check, &QCheckBox::toggled, this, &LightSimulationApp::toggle_dispersion);
    connect(white_light_check, &QCheckBox::toggled, this, &LightSimulationApp::toggle_white_light);
}

void LightSimulationApp::setup_medium_controls(QHBoxLayout* layout, int slot) {
    const int i = slot - 1;
    QGroupBox* group = new QGroupBox(QString("Medium %1").arg(slot));
    QVBoxLayout* group_layout = new QVBoxLayout(group);

    QComboBox* combo = new QComboBox();
    for (const Medium& medium : mediumPresets()) {
        combo->addItem(medium.name);
    }
    combo->setCurrentText(media.name(slot));
    group_layout->addWidget(combo);

    const double n = params.refractiveIndex(slot);
    IndexSlider* slider = new IndexSlider(n);
    QLabel* value = new QLabel(QString::number(n, 'f', 4));
    group_layout->addLayout(labelledRow(QString("n%1:").arg(slot), slider, value));

    layout->addWidget(group);
    medium_combos[i] = combo;
    index_sliders[i] = slider;
    index_values[i] = value;

    connect(combo, &QComboBox::currentTextChanged, this, [this, slot](const QString& name) {
        update_medium(slot, name);
    });
    connect(slider, &IndexSlider::indexChanged, this, [this, slot](double n) {
        update_index(slot, n);
    });
}

void LightSimulationApp::refresh() {
    wave_widget->refreshDecorations(params, media);
}

void LightSimulationApp::update_wavelength(int value) {
    if (params.setWavelength(value)) {
        wavelength_value->setText(QString("%1 nm").arg(value));
        refresh();
    }
}

void LightSimulationApp::update_amplitude(int value) {
    if (params.setAmplitude(value)) {
        amplitude_value->setText(QString::number(value));
        refresh();
    }
}

void LightSimulationApp::update_speed(int value) {
    if (params.setSpeed(value)) {
        speed_value->setText(QString::number(value));
    }
}

void LightSimulationApp::update_zoom(int value) {
    const double zoom = value / 10.0;
    zoom_value->setText(QString("%1x").arg(zoom, 0, 'f', 1));
    wave_widget->setZoom(zoom);
}

void LightSimulationApp::update_index(int slot, double n) {
    if (params.setRefractiveIndex(slot, n)) {
        index_values[slot - 1]->setText(QString::number(n, 'f', 4));
        refresh();
    }
}

void LightSimulationApp::update_medium(int slot, const QString& medium_name) {
    if (!applyMedium(params, slot, medium_name)) {
        return;
    }
    media.setName(slot, medium_name);

    // Keep the exact preset index rather than the slider's rounded one
    const double n = params.refractiveIndex(slot);
    index_sliders[slot - 1]->showIndex(n);
    index_values[slot - 1]->setText(QString::number(n, 'f', 4));
    refresh();
}

void LightSimulationApp::toggle_dispersion(bool enabled) {
    params.setDispersionEnabled(enabled);
}

void LightSimulationApp::toggle_white_light(bool enabled) {
    params.setWhiteLightEnabled(enabled);
    wave_widget->setWhiteLight(enabled);
    refresh();
    wave_widget->showFrame(driver->computeFrame());
}

void LightSimulationApp::toggle_pause(bool paused) {
    driver->setPaused(paused);
}

void LightSimulationApp::apply_scenario() {
    const QString scenario_name = scenario_combo->currentText();
    if (!applyScenario(params, media, scenario_name)) {
        return;
    }

    for (int slot = 1; slot <= 3; ++slot) {
        const int i = slot - 1;
        {
            const QSignalBlocker blocker(medium_combos[i]);
            medium_combos[i]->setCurrentText(media.name(slot));
        }
        const double n = params.refractiveIndex(slot);
        index_sliders[i]->showIndex(n);
        index_values[i]->setText(QString::number(n, 'f', 4));
    }
    qCInfo(lcUi) << "scenario" << scenario_name << "applied";
    refresh();
}
