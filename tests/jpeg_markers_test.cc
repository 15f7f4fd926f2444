#include "jpegseg/jpeg_markers.h"

#include <gtest/gtest.h>

#include <string_view>

namespace jpegseg {

TEST(JpegMarkers, NamesSpecialCodes)
{
    EXPECT_EQ(marker_name(0x00), "NUL");
    EXPECT_EQ(marker_name(kMarkerTem), "TEM");
    EXPECT_EQ(marker_name(kMarkerSoi), "SOI");
    EXPECT_EQ(marker_name(kMarkerEoi), "EOI");
    EXPECT_EQ(marker_name(kMarkerSos), "SOS");
    EXPECT_EQ(marker_name(kMarkerDqt), "DQT");
    EXPECT_EQ(marker_name(kMarkerDnl), "DNL");
    EXPECT_EQ(marker_name(kMarkerDri), "DRI");
    EXPECT_EQ(marker_name(kMarkerDhp), "DHP");
    EXPECT_EQ(marker_name(kMarkerExp), "EXP");
    EXPECT_EQ(marker_name(kMarkerCom), "COM");
    EXPECT_EQ(marker_name(kMarkerFill), "FILL");
}


TEST(JpegMarkers, NamesReservedRange)
{
    EXPECT_EQ(marker_name(0x02), "RES02");
    EXPECT_EQ(marker_name(0x4A), "RES4A");
    EXPECT_EQ(marker_name(0xBF), "RESBF");
}


TEST(JpegMarkers, NamesStartOfFrameFamilyWithExceptions)
{
    EXPECT_EQ(marker_name(0xC0), "SOF0");
    EXPECT_EQ(marker_name(0xC3), "SOF3");
    EXPECT_EQ(marker_name(0xC4), "DHT");
    EXPECT_EQ(marker_name(0xC8), "JPG");
    EXPECT_EQ(marker_name(0xCC), "DAC");
    EXPECT_EQ(marker_name(0xCB), "SOF11");
    EXPECT_EQ(marker_name(0xCF), "SOF15");
}


TEST(JpegMarkers, NamesNumberedFamilies)
{
    EXPECT_EQ(marker_name(0xD0), "RST0");
    EXPECT_EQ(marker_name(0xD7), "RST7");
    EXPECT_EQ(marker_name(0xE0), "APP0");
    EXPECT_EQ(marker_name(0xE2), "APP2");
    EXPECT_EQ(marker_name(0xEF), "APP15");
    EXPECT_EQ(marker_name(0xF0), "JPG0");
    EXPECT_EQ(marker_name(0xFD), "JPG13");
}


TEST(JpegMarkers, EveryCodeHasAName)
{
    for (uint32_t code = 0; code <= 0xFF; ++code) {
        EXPECT_FALSE(marker_name(static_cast<uint8_t>(code)).empty())
            << "code " << code;
    }
}


TEST(JpegMarkers, PayloadClassification)
{
    EXPECT_TRUE(marker_has_payload(kMarkerSoi));
    EXPECT_FALSE(marker_has_payload(kMarkerEoi));
    EXPECT_FALSE(marker_has_payload(kMarkerTem));
    for (uint8_t n = 0; n < 8; ++n) {
        EXPECT_FALSE(marker_has_payload(static_cast<uint8_t>(kMarkerRst0 + n)));
        EXPECT_TRUE(starts_scan_data(static_cast<uint8_t>(kMarkerRst0 + n)));
    }
    EXPECT_TRUE(marker_has_payload(kMarkerSos));
    EXPECT_TRUE(marker_has_payload(kMarkerApp2));
    EXPECT_TRUE(marker_has_payload(kMarkerCom));
    EXPECT_TRUE(marker_has_payload(kMarkerDht));
    EXPECT_TRUE(starts_scan_data(kMarkerSos));
    EXPECT_FALSE(starts_scan_data(kMarkerDqt));

    EXPECT_TRUE(is_app_marker(0xE0));
    EXPECT_TRUE(is_app_marker(0xEF));
    EXPECT_FALSE(is_app_marker(0xF0));
    EXPECT_TRUE(is_jpg_marker(0xF0));
    EXPECT_TRUE(is_jpg_marker(0xFD));
    EXPECT_FALSE(is_jpg_marker(0xFE));
}

}  // namespace jpegseg
