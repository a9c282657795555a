/**
 * @file car_catalog.h
 * @brief Static catalog of the supported Shell Racing Legends cars
 *
 * Each car advertises a fixed BLE name ("SL-..."). Two models never
 * advertise at all and carry the "---" sentinel: they can be listed but
 * never discovered by a scan.
 */

#ifndef CAR_CATALOG_H
#define CAR_CATALOG_H

#include <stddef.h>

// Bluetooth name sentinel for models that are not advertisable
#define SLR_NOT_ADVERTISABLE  "---"

struct CarModel {
    const char* internalName;    // Stable id, e.g. "SF24"
    const char* displayName;     // Marketing name, may be empty
    const char* bluetoothName;   // Advertised name or SLR_NOT_ADVERTISABLE
};

size_t getCarModelCount();
const CarModel* getCarModels();

// Case-insensitive lookup by internal name
const CarModel* findCarModel(const char* internalName);

/**
 * @brief Match an advertised name against the catalog
 *
 * Case-insensitive. An exact match wins; otherwise the model with the
 * longest Bluetooth name that prefixes the advertised name is returned,
 * so "SL-SF90 Spider N" resolves to the black Spider and not the red one.
 *
 * @return Matching model, or nullptr if the name is unknown or empty
 */
const CarModel* matchAdvertisedName(const char* advertisedName);

bool isAdvertisable(const CarModel& model);

// Display name, or the internal name when the display name is empty
const char* getCarLabel(const CarModel& model);

#endif // CAR_CATALOG_H
