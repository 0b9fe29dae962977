// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "config/AppConfig.hpp"

#include <QtCore/QJsonValue>

Q_LOGGING_CATEGORY(configlog, "isopgem.config")

namespace Config {

namespace {

using namespace Qt::StringLiterals;

class FieldReader final
{
public:
    FieldReader(const QJsonObject& object, QString path, QStringList* warnings)
        : m_object(object)
        , m_path(std::move(path))
        , m_warnings(warnings)
    {}

    FieldReader child(const QString& key) const
    {
        const QJsonValue v = m_object.value(key);
        if (!v.isUndefined() && !v.isObject())
            warn(key, u"object"_s);
        return FieldReader(v.toObject(), qualified(key), m_warnings);
    }

    void read(const QString& key, QString& out) const
    {
        const QJsonValue v = m_object.value(key);
        if (v.isUndefined())
            return;
        if (!v.isString()) {
            warn(key, u"string"_s);
            return;
        }
        out = v.toString();
    }

    void read(const QString& key, bool& out) const
    {
        const QJsonValue v = m_object.value(key);
        if (v.isUndefined())
            return;
        if (!v.isBool()) {
            warn(key, u"boolean"_s);
            return;
        }
        out = v.toBool();
    }

    void read(const QString& key, int& out, int minimum) const
    {
        const QJsonValue v = m_object.value(key);
        if (v.isUndefined())
            return;
        if (!v.isDouble() || v.toInt(minimum - 1) < minimum) {
            warn(key, u"integer >= %1"_s.arg(minimum));
            return;
        }
        out = v.toInt();
    }

    void read(const QString& key, QColor& out) const
    {
        const QJsonValue v = m_object.value(key);
        if (v.isUndefined())
            return;
        const QColor c(v.toString());
        if (!v.isString() || !c.isValid()) {
            warn(key, u"color"_s);
            return;
        }
        out = c;
    }

    void read(const QString& key, Environment& out) const
    {
        const QJsonValue v = m_object.value(key);
        if (v.isUndefined())
            return;
        Environment env{};
        if (!v.isString() || !environmentFromString(v.toString(), env)) {
            warn(key, u"environment name"_s);
            return;
        }
        out = env;
    }

    void readColorMap(const QString& key, QHash<QString, QColor>& out) const
    {
        const FieldReader map = child(key);
        for (auto it = map.m_object.constBegin(); it != map.m_object.constEnd(); ++it) {
            QColor color;
            map.read(it.key(), color);
            if (color.isValid())
                out.insert(it.key(), color);
        }
    }

private:
    QString qualified(const QString& key) const
    {
        return m_path.isEmpty() ? key : m_path + u'.' + key;
    }

    void warn(const QString& key, const QString& expected) const
    {
        const QString msg = u"Ignoring '%1': expected %2"_s.arg(qualified(key), expected);
        qCWarning(configlog).noquote() << msg;
        if (m_warnings)
            m_warnings->push_back(msg);
    }

    QJsonObject m_object;
    QString m_path;
    QStringList* m_warnings = nullptr;
};

void readPillar(const FieldReader& pillars, const QString& key, PillarSettings& out)
{
    pillars.child(key).read(u"enabled"_s, out.enabled);
}

} // namespace

QString environmentName(Environment env)
{
    switch (env) {
        case Environment::Development: return u"development"_s;
        case Environment::Production: return u"production"_s;
        case Environment::Test: return u"test"_s;
    }
    return u"development"_s;
}

bool environmentFromString(const QString& text, Environment& out)
{
    const QString key = text.trimmed().toLower();
    if (key == u"development"_s || key == u"dev"_s) {
        out = Environment::Development;
        return true;
    }
    if (key == u"production"_s || key == u"prod"_s) {
        out = Environment::Production;
        return true;
    }
    if (key == u"test"_s || key == u"testing"_s) {
        out = Environment::Test;
        return true;
    }
    return false;
}

AppConfig AppConfig::defaults()
{
    AppConfig cfg;
    cfg.ui.pillarAccents = {
        {u"Gematria"_s, QColor(u"#673AB7"_s)},
        {u"Geometry"_s, QColor(u"#009688"_s)},
        {u"Document Manager"_s, QColor(u"#FFC107"_s)},
        {u"Astrology"_s, QColor(u"#1565C0"_s)},
        {u"TQ"_s, QColor(u"#43A047"_s)},
    };
    return cfg;
}

AppConfig AppConfig::fromJson(const QJsonObject& root, const AppConfig& base, QStringList* warnings)
{
    AppConfig cfg = base;
    const FieldReader doc(root, QString(), warnings);

    const FieldReader app = doc.child(u"application"_s);
    app.read(u"name"_s, cfg.application.name);
    app.read(u"version"_s, cfg.application.version);
    app.read(u"environment"_s, cfg.application.environment);
    app.read(u"debug"_s, cfg.application.debug);
    app.read(u"logLevel"_s, cfg.application.logLevel);
    app.read(u"theme"_s, cfg.application.theme);
    app.read(u"locale"_s, cfg.application.locale);

    const FieldReader ui = doc.child(u"ui"_s);
    const FieldReader window = ui.child(u"window"_s);
    window.read(u"width"_s, cfg.ui.window.width, 1);
    window.read(u"height"_s, cfg.ui.window.height, 1);
    window.read(u"title"_s, cfg.ui.window.title);
    window.read(u"maximizeOnStart"_s, cfg.ui.window.maximizeOnStart);

    const FieldReader fonts = ui.child(u"fonts"_s);
    fonts.read(u"main"_s, cfg.ui.fonts.main);
    fonts.read(u"size"_s, cfg.ui.fonts.size, 1);

    const FieldReader colors = ui.child(u"themeColors"_s);
    colors.read(u"primary"_s, cfg.ui.themeColors.primary);
    colors.read(u"secondary"_s, cfg.ui.themeColors.secondary);
    colors.read(u"background"_s, cfg.ui.themeColors.background);
    colors.read(u"text"_s, cfg.ui.themeColors.text);

    ui.readColorMap(u"pillarAccents"_s, cfg.ui.pillarAccents);

    const FieldReader pillars = doc.child(u"pillars"_s);
    readPillar(pillars, u"gematria"_s, cfg.pillars.gematria);
    readPillar(pillars, u"geometry"_s, cfg.pillars.geometry);
    readPillar(pillars, u"documentManager"_s, cfg.pillars.documentManager);
    readPillar(pillars, u"astrology"_s, cfg.pillars.astrology);
    readPillar(pillars, u"tq"_s, cfg.pillars.tq);

    return cfg;
}

} // namespace Config
