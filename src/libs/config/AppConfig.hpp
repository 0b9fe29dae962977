// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "config/ConfigGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtGui/QColor>

namespace Config {

enum class Environment : unsigned char {
    Development,
    Production,
    Test
};

CONFIG_EXPORT QString environmentName(Environment env);
CONFIG_EXPORT bool environmentFromString(const QString& text, Environment& out);

struct ApplicationSettings final {
    QString name = QStringLiteral("IsopGem");
    QString version = QStringLiteral("0.1.0");
    Environment environment = Environment::Development;
    bool debug = false;
    QString logLevel = QStringLiteral("INFO");
    QString theme = QStringLiteral("light");
    QString locale = QStringLiteral("en_US");
};

struct WindowSettings final {
    int width = 1280;
    int height = 800;
    QString title = QStringLiteral("IsopGem - Sacred Geometry & Gematria Tool");
    bool maximizeOnStart = false;
};

struct FontSettings final {
    QString main = QStringLiteral("Roboto");
    int size = 12;
};

struct ThemeColors final {
    QColor primary{0x4a, 0x86, 0xe8};
    QColor secondary{0xff, 0x99, 0x00};
    QColor background{0xff, 0xff, 0xff};
    QColor text{0x33, 0x33, 0x33};
};

struct UiSettings final {
    WindowSettings window;
    FontSettings fonts;
    ThemeColors themeColors;

    // Tab title -> accent used by the tab strip.
    QHash<QString, QColor> pillarAccents;

    QColor pillarAccent(const QString& tabTitle) const { return pillarAccents.value(tabTitle); }
};

struct PillarSettings final {
    bool enabled = true;
};

struct PillarsSettings final {
    PillarSettings gematria;
    PillarSettings geometry;
    PillarSettings documentManager;
    PillarSettings astrology;
    PillarSettings tq;
};

struct CONFIG_EXPORT AppConfig final {
    ApplicationSettings application;
    UiSettings ui;
    PillarsSettings pillars;

    // Built-in values used for every field a configuration file leaves out.
    static AppConfig defaults();

    // Maps a merged configuration document onto `base`. Fields that are
    // missing or of the wrong type keep the value from `base`; each ignored
    // field is reported in `warnings`.
    static AppConfig fromJson(const QJsonObject& root,
                              const AppConfig& base = defaults(),
                              QStringList* warnings = nullptr);
};

} // namespace Config
