// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "windowing/WindowingGlobal.hpp"
#include "windowing/api/SurfaceTypes.hpp"

#include <QtCore/QString>

QT_BEGIN_NAMESPACE
class QWidget;
QT_END_NAMESPACE

namespace Windowing {

// Capability shared by every top-level surface the WindowManager tracks.
// Implementations are QWidgets created with Qt::WA_DeleteOnClose; surfaceWidget()
// returns that widget.
class WINDOWING_EXPORT ISurface
{
public:
    virtual ~ISurface() = default;

    virtual SurfaceKind kind() const = 0;
    virtual QWidget* surfaceWidget() = 0;

    // Empty until the registry attaches the surface.
    virtual QString surfaceKey() const = 0;
    virtual quint64 instanceId() const = 0;
    virtual void attachToRegistry(const QString& key, quint64 instanceId) = 0;

    virtual SurfaceState state() const = 0;
    virtual bool hasBeenShown() const = 0;

    // Takes ownership of `content`. The previous content is detached and
    // scheduled for deletion. Null is rejected.
    virtual bool setContent(QWidget* content, QString* errorOut = nullptr) = 0;

    // Detaches the current content and hands ownership to the caller.
    virtual QWidget* takeContent() = 0;
    virtual QWidget* content() const = 0;

    // Shows, raises and activates the surface.
    virtual void bringToFront() = 0;
};

} // namespace Windowing
