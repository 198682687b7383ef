#include <gtest/gtest.h>

#include "BLETypes.h"

using Bluewatch::BLE::BLEAddress;
using Bluewatch::BLE::DeviceInfo;
using Bluewatch::BLE::deviceIdFor;

// Numeric form maps MSB-first onto the colon string.
TEST(BLEAddress, FromUInt64ToString) {
    EXPECT_EQ(BLEAddress::fromUInt64(0xAABBCCDDEEFFULL).toString(), "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(BLEAddress::fromUInt64(0x000000000001ULL).toString(), "00:00:00:00:00:01");
}

// Resolver ids win; otherwise the id comes from the address.
TEST(BLEAddress, DeviceIdDerivation) {
    DeviceInfo info;
    info.address = 0x112233445566ULL;
    EXPECT_EQ(deviceIdFor(info), "11:22:33:44:55:66");

    info.id = "BluetoothLE#custom";
    EXPECT_EQ(deviceIdFor(info), "BluetoothLE#custom");
}

// Bits above the 48-bit address space do not leak into the derived id.
TEST(BLEAddress, DeviceIdIgnoresHighBits) {
    DeviceInfo info;
    info.address = 0xFFFF112233445566ULL;
    EXPECT_EQ(deviceIdFor(info), "11:22:33:44:55:66");
}
