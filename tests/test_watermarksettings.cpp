/*
 * test_watermarksettings.cpp - Watermark settings from and to JSON
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "watermarksettings.h"

using namespace Watermark;

static QJsonObject parse(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

// MARK: - Defaults

TEST(WatermarkSettingsTest, Defaults) {
    const Settings s = Settings::fromJson(QJsonObject());
    EXPECT_TRUE(s.text.isEmpty());
    EXPECT_DOUBLE_EQ(s.opacity, 30.0);
    EXPECT_EQ(s.fontSize, FontSize::Medium);
    EXPECT_DOUBLE_EQ(s.pointSize(), 48.0);
    EXPECT_EQ(s.color, Settings::defaultColor());
    EXPECT_EQ(s.position.type, PositionType::Center);
    EXPECT_FALSE(s.style.rotationDeg.has_value());
    EXPECT_FALSE(s.transparency.has_value());
    EXPECT_FALSE(s.pageSpecific.has_value());
    EXPECT_EQ(s.templ, Template::None);
    EXPECT_EQ(s.organization, QStringLiteral("CPGS Corporation"));
}

// MARK: - Parsing

TEST(WatermarkSettingsTest, FullObject) {
    const Settings s = Settings::fromJson(parse(R"({
        "text": "INTERNAL",
        "opacity": 45,
        "fontSize": "large",
        "color": "#ff0000",
        "position": {"type": "corner", "corner": "top-left", "offset": {"x": 4, "y": -6}},
        "style": {
            "fontFamily": "Times",
            "rotation": 15,
            "effects": {"shadow": {"offsetX": 3, "color": "#333333"}, "outline": {"width": 2}}
        },
        "transparency": {"type": "gradient", "value": {"start": 20, "end": 80}},
        "pageSpecific": {
            "pageRange": "odd",
            "conditional": {"hasTables": true, "contentLength": "long"},
            "customText": "Page {pageNumber}"
        },
        "template": "draft",
        "organization": "Acme"
    })"));

    EXPECT_EQ(s.text, QStringLiteral("INTERNAL"));
    EXPECT_DOUBLE_EQ(s.opacity, 45.0);
    EXPECT_DOUBLE_EQ(s.pointSize(), 64.0);
    EXPECT_TRUE(s.font().bold);
    EXPECT_EQ(s.font().family, Render::FontFamily::Times);
    EXPECT_EQ(s.color, QColor(255, 0, 0));

    EXPECT_EQ(s.position.type, PositionType::Corner);
    EXPECT_EQ(s.position.corner, Corner::TopLeft);
    EXPECT_EQ(s.position.offset, QPointF(4, -6));

    ASSERT_TRUE(s.style.rotationDeg.has_value());
    EXPECT_DOUBLE_EQ(*s.style.rotationDeg, 15.0);
    ASSERT_TRUE(s.style.shadow.has_value());
    EXPECT_DOUBLE_EQ(s.style.shadow->offsetX, 3.0);
    EXPECT_DOUBLE_EQ(s.style.shadow->offsetY, -2.0);
    EXPECT_EQ(s.style.shadow->color, QColor(0x33, 0x33, 0x33));
    ASSERT_TRUE(s.style.outline.has_value());
    EXPECT_DOUBLE_EQ(s.style.outline->width, 2.0);

    ASSERT_TRUE(s.transparency.has_value());
    EXPECT_EQ(s.transparency->type, TransparencyType::Gradient);
    EXPECT_DOUBLE_EQ(s.transparency->start, 20.0);
    EXPECT_DOUBLE_EQ(s.transparency->end, 80.0);

    ASSERT_TRUE(s.pageSpecific.has_value());
    EXPECT_EQ(s.pageSpecific->pageRange, PageRange::Odd);
    ASSERT_TRUE(s.pageSpecific->conditional.has_value());
    EXPECT_EQ(s.pageSpecific->conditional->hasTables, std::optional<bool>(true));
    EXPECT_FALSE(s.pageSpecific->conditional->hasImages.has_value());
    EXPECT_EQ(s.pageSpecific->conditional->contentLength,
              std::optional<ContentLength>(ContentLength::Long));
    EXPECT_EQ(s.pageSpecific->customText, QStringLiteral("Page {pageNumber}"));

    EXPECT_EQ(s.templ, Template::Draft);
    EXPECT_EQ(s.organization, QStringLiteral("Acme"));
}

TEST(WatermarkSettingsTest, NumericFontSizeOverridesNamedSize) {
    const Settings s = Settings::fromJson(parse(R"({"fontSize": 30})"));
    EXPECT_DOUBLE_EQ(s.pointSize(), 30.0);
    EXPECT_FALSE(s.font().bold);
}

TEST(WatermarkSettingsTest, UnsupportedColorFallsBackToDefault) {
    EXPECT_EQ(Settings::parseColor(QStringLiteral("rgb(1,2,3)")), Settings::defaultColor());
    EXPECT_EQ(Settings::parseColor(QStringLiteral("#12345")), Settings::defaultColor());
    EXPECT_EQ(Settings::parseColor(QStringLiteral(" #00ff00 ")), QColor(0, 255, 0));
}

TEST(WatermarkSettingsTest, UnknownEnumValuesUseDefaults) {
    const Settings s = Settings::fromJson(parse(
        R"({"position": {"type": "diagonal", "corner": "middle"}, "template": "secret"})"));
    EXPECT_EQ(s.position.type, PositionType::Center);
    EXPECT_EQ(s.position.corner, Corner::BottomRight);
    EXPECT_EQ(s.templ, Template::None);
}

TEST(WatermarkSettingsTest, PageRangeForms) {
    const Settings expr = Settings::fromJson(parse(R"({"pageSpecific": {"pageRange": "2-4, last"}})"));
    ASSERT_TRUE(expr.pageSpecific.has_value());
    EXPECT_EQ(expr.pageSpecific->pageRange, PageRange::Pages);
    EXPECT_EQ(expr.pageSpecific->pageExpression, QStringLiteral("2-4, last"));

    const Settings list = Settings::fromJson(parse(R"({"pageSpecific": {"pageRange": [1, 3]}})"));
    EXPECT_EQ(list.pageSpecific->pageRange, PageRange::Pages);
    EXPECT_EQ(list.pageSpecific->pages, QList<int>({1, 3}));
}

TEST(WatermarkSettingsTest, PagesKeywordReadsPagesField) {
    const Settings list = Settings::fromJson(parse(
        R"({"pageSpecific": {"pageRange": "pages", "pages": [2]}})"));
    ASSERT_TRUE(list.pageSpecific.has_value());
    EXPECT_EQ(list.pageSpecific->pageRange, PageRange::Pages);
    EXPECT_EQ(list.pageSpecific->pages, QList<int>({2}));
    EXPECT_TRUE(list.pageSpecific->pageExpression.isEmpty());

    const Settings expr = Settings::fromJson(parse(
        R"({"pageSpecific": {"pageRange": "pages", "pages": "1, last"}})"));
    EXPECT_EQ(expr.pageSpecific->pageRange, PageRange::Pages);
    EXPECT_EQ(expr.pageSpecific->pageExpression, QStringLiteral("1, last"));
}

TEST(WatermarkSettingsTest, RotationDegIsRead) {
    const Settings s = Settings::fromJson(parse(R"({"style": {"rotationDeg": 15}})"));
    ASSERT_TRUE(s.style.rotationDeg.has_value());
    EXPECT_DOUBLE_EQ(*s.style.rotationDeg, 15.0);

    const Settings legacy = Settings::fromJson(parse(R"({"style": {"rotation": -30}})"));
    ASSERT_TRUE(legacy.style.rotationDeg.has_value());
    EXPECT_DOUBLE_EQ(*legacy.style.rotationDeg, -30.0);
}

TEST(WatermarkSettingsTest, CustomCoordinates) {
    const Settings s = Settings::fromJson(parse(
        R"({"position": {"type": "custom", "coordinates": [{"x": 10, "y": 20}, {"x": 300, "y": 400}]}})"));
    EXPECT_EQ(s.position.type, PositionType::Custom);
    ASSERT_EQ(s.position.coordinates.size(), 2);
    EXPECT_EQ(s.position.coordinates[1], QPointF(300, 400));
}

// MARK: - Serialization

TEST(WatermarkSettingsTest, ToJsonIsReadBack) {
    Settings s;
    s.text = QStringLiteral("REVIEW");
    s.opacity = 55;
    s.position.type = PositionType::Multiple;
    s.style.rotationDeg = -30.0;
    Transparency t;
    t.type = TransparencyType::Fade;
    t.value = 60.0;
    s.transparency = t;
    PageSpecific ps;
    ps.pageRange = PageRange::Last;
    s.pageSpecific = ps;
    s.templ = Template::Confidential;

    const Settings back = Settings::fromJson(s.toJson());
    EXPECT_EQ(back.text, s.text);
    EXPECT_DOUBLE_EQ(back.opacity, 55.0);
    EXPECT_EQ(back.position.type, PositionType::Multiple);
    EXPECT_EQ(back.style.rotationDeg, std::optional<qreal>(-30.0));
    ASSERT_TRUE(back.transparency.has_value());
    EXPECT_EQ(back.transparency->type, TransparencyType::Fade);
    EXPECT_EQ(back.transparency->value, std::optional<qreal>(60.0));
    ASSERT_TRUE(back.pageSpecific.has_value());
    EXPECT_EQ(back.pageSpecific->pageRange, PageRange::Last);
    EXPECT_EQ(back.templ, Template::Confidential);
}
