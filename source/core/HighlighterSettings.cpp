// ============================================================================
// HighlighterSettings - Implementation
// ============================================================================

#include "HighlighterSettings.h"

#include <QDebug>
#include <QSettings>
#include <QStringList>
#include <QtGlobal>

HighlighterSettings::HighlighterSettings()
    : palette(defaultPalette())
{
}

QVector<QColor> HighlighterSettings::defaultPalette()
{
    static const char* const hexColors[] = {
        "#ffeb3b", "#ffd54f", "#ffe082", "#ffcc80", "#ffab91",
        "#f48fb1", "#f8bbd0", "#ce93d8", "#b39ddb", "#90caf9",
        "#80cbc4", "#a5d6a7", "#c5e1a5", "#b2dfdb", "#cfd8dc"
    };

    QVector<QColor> colors;
    colors.reserve(static_cast<int>(sizeof(hexColors) / sizeof(hexColors[0])));
    for (const char* hex : hexColors) {
        colors.append(colorFromHex(QString::fromLatin1(hex)));
    }
    return colors;
}

QColor HighlighterSettings::colorFromHex(const QString& hex)
{
    QString clean = hex.trimmed();
    if (clean.startsWith('#')) {
        clean.remove(0, 1);
    }

    // Expand shorthand "#abc" -> "#aabbcc"
    if (clean.size() == 3) {
        QString full;
        for (const QChar c : clean) {
            full.append(c).append(c);
        }
        clean = full;
    }

    if (clean.size() != 6) {
        return QColor();
    }

    bool ok = false;
    const uint value = clean.toUInt(&ok, 16);
    if (!ok) {
        return QColor();
    }
    return QColor((value >> 16) & 0xff, (value >> 8) & 0xff, value & 0xff);
}

void HighlighterSettings::sanitize()
{
    if (minThickness <= 0.0) minThickness = 1.0;
    if (maxThickness < minThickness) maxThickness = minThickness;
    if (minOpacity <= 0.0) minOpacity = 0.01;
    maxOpacity = qBound(minOpacity, maxOpacity, 0.99);
    if (baseScale <= 0.0) baseScale = 1.25;
    if (minZoom <= 0.0) minZoom = 0.1;
    if (maxZoom < minZoom) maxZoom = minZoom;
    if (zoomStep <= 0.0) zoomStep = 0.1;
    if (minBoxSizePx < 0.0) minBoxSizePx = 0.0;

    defaultOpacity = clampOpacity(defaultOpacity);
    defaultThickness = clampThickness(defaultThickness);

    if (palette.isEmpty()) {
        palette = defaultPalette();
    }
    if (!defaultColor.isValid()) {
        defaultColor = palette.first();
    }
    if (exportFileName.trimmed().isEmpty()) {
        exportFileName = QStringLiteral("annotated.pdf");
    }
}

qreal HighlighterSettings::clampZoom(qreal zoom) const
{
    return qBound(minZoom, zoom, maxZoom);
}

qreal HighlighterSettings::clampOpacity(qreal opacity) const
{
    return qBound(minOpacity, opacity, maxOpacity);
}

qreal HighlighterSettings::clampThickness(qreal thickness) const
{
    return qBound(minThickness, thickness, maxThickness);
}

ToolState HighlighterSettings::defaultToolState() const
{
    ToolState tool;
    tool.color = defaultColor;
    tool.opacity = defaultOpacity;
    tool.thickness = defaultThickness;
    tool.eraser = false;
    return tool;
}

HighlighterSettings HighlighterSettings::load(QSettings& settings)
{
    HighlighterSettings s;

    settings.beginGroup(QStringLiteral("highlighter"));
    const QStringList paletteHex = settings.value(QStringLiteral("palette")).toStringList();
    if (!paletteHex.isEmpty()) {
        QVector<QColor> colors;
        for (const QString& hex : paletteHex) {
            QColor c = colorFromHex(hex);
            if (c.isValid()) {
                colors.append(c);
            } else {
                qWarning() << "[HighlighterSettings] Ignoring invalid palette color:" << hex;
            }
        }
        if (!colors.isEmpty()) {
            s.palette = colors;
        }
    }
    if (settings.contains(QStringLiteral("color"))) {
        s.defaultColor = colorFromHex(settings.value(QStringLiteral("color")).toString());
    }
    s.defaultOpacity = settings.value(QStringLiteral("opacity"), s.defaultOpacity).toDouble();
    s.defaultThickness = settings.value(QStringLiteral("thickness"), s.defaultThickness).toDouble();
    s.minThickness = settings.value(QStringLiteral("minThickness"), s.minThickness).toDouble();
    s.maxThickness = settings.value(QStringLiteral("maxThickness"), s.maxThickness).toDouble();
    s.minOpacity = settings.value(QStringLiteral("minOpacity"), s.minOpacity).toDouble();
    s.maxOpacity = settings.value(QStringLiteral("maxOpacity"), s.maxOpacity).toDouble();
    s.mode = annotationModeFromString(
        settings.value(QStringLiteral("mode"), annotationModeToString(s.mode)).toString());
    s.minBoxSizePx = settings.value(QStringLiteral("minBoxSize"), s.minBoxSizePx).toDouble();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("view"));
    s.baseScale = settings.value(QStringLiteral("baseScale"), s.baseScale).toDouble();
    s.minZoom = settings.value(QStringLiteral("minZoom"), s.minZoom).toDouble();
    s.maxZoom = settings.value(QStringLiteral("maxZoom"), s.maxZoom).toDouble();
    s.zoomStep = settings.value(QStringLiteral("zoomStep"), s.zoomStep).toDouble();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("export"));
    s.exportFileName = settings.value(QStringLiteral("fileName"), s.exportFileName).toString();
    s.exportFlatten = settings.value(QStringLiteral("flatten"), s.exportFlatten).toBool();
    s.exportJpeg = settings.value(QStringLiteral("jpeg"), s.exportJpeg).toBool();
    settings.endGroup();

    s.sanitize();
    return s;
}

void HighlighterSettings::save(QSettings& settings) const
{
    QStringList paletteHex;
    for (const QColor& c : palette) {
        paletteHex.append(c.name(QColor::HexRgb));
    }

    settings.beginGroup(QStringLiteral("highlighter"));
    settings.setValue(QStringLiteral("palette"), paletteHex);
    settings.setValue(QStringLiteral("color"), defaultColor.name(QColor::HexRgb));
    settings.setValue(QStringLiteral("opacity"), defaultOpacity);
    settings.setValue(QStringLiteral("thickness"), defaultThickness);
    settings.setValue(QStringLiteral("minThickness"), minThickness);
    settings.setValue(QStringLiteral("maxThickness"), maxThickness);
    settings.setValue(QStringLiteral("minOpacity"), minOpacity);
    settings.setValue(QStringLiteral("maxOpacity"), maxOpacity);
    settings.setValue(QStringLiteral("mode"), annotationModeToString(mode));
    settings.setValue(QStringLiteral("minBoxSize"), minBoxSizePx);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("view"));
    settings.setValue(QStringLiteral("baseScale"), baseScale);
    settings.setValue(QStringLiteral("minZoom"), minZoom);
    settings.setValue(QStringLiteral("maxZoom"), maxZoom);
    settings.setValue(QStringLiteral("zoomStep"), zoomStep);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("export"));
    settings.setValue(QStringLiteral("fileName"), exportFileName);
    settings.setValue(QStringLiteral("flatten"), exportFlatten);
    settings.setValue(QStringLiteral("jpeg"), exportJpeg);
    settings.endGroup();
}

HighlighterSettings HighlighterSettings::load()
{
    QSettings settings("PdfHighlighter", "App");
    return load(settings);
}

void HighlighterSettings::save() const
{
    QSettings settings("PdfHighlighter", "App");
    save(settings);
}
