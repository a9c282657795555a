#include "car_catalog.h"

#include <ctype.h>
#include <string.h>

static const CarModel kCarModels[] = {
    {"12CILINDRI",        "12Cilindri",                         "SL-12Cilindri"},
    {"296GT3",            "296 GT3",                            "SL-296 GT3"},
    {"296GTB",            "296 GTB",                            "SL-296 GTB"},
    {"330P",              "330 P 1965",                         SLR_NOT_ADVERTISABLE},
    {"330P4",             "330 P4",                             "SL-330 P4(1967)"},
    {"488EVO",            "488 Challenge Evo",                  "SL-488 Challenge Evo"},
    {"488GTE",            "488 GTE - AF Corse #51 2019",        "SL-488 GTE"},
    {"499P",              "499 P",                              "SL-499P"},
    {"499P(2024)",        "499P(2024)",                         "SL-499P N"},
    {"512S",              "512 S 1970",                         SLR_NOT_ADVERTISABLE},
    {"DaytonaSP3",        "Daytona SP3",                        "SL-Daytona SP3"},
    {"F175",              "F1-75",                              "SL-F1-75"},
    {"FXXK",              "FXX-K EVO",                          "SL-FXX-K Evo"},
    {"PUROSANGUE",        "Purosangue",                         "SL-Purosangue"},
    {"SF1000",            "SF1000 - Tuscan GP - Ferrari 1000",  "SL-SF1000"},
    {"SF23",              "SF-23",                              "SL-SF-23"},
    {"SF24",              "SF-24",                              "SL-SF-24"},
    {"SF90SPIDER",        "SF90 Spider",                        "SL-SF90 Spider"},
    {"SF90SPIDER(BLACK)", "SF90 Spider (Black)",                "SL-SF90 Spider N"},
    {"ShellCar",          "",                                   "SL-Shell Car"},
};

static const size_t kCarModelCount = sizeof(kCarModels) / sizeof(kCarModels[0]);

// Case-insensitive compare of the first n characters
static bool equalsIgnoreCase(const char* a, const char* b, size_t n) {
    for (size_t i = 0; i < n; i++) {
        if (tolower((unsigned char)a[i]) != tolower((unsigned char)b[i])) {
            return false;
        }
    }
    return true;
}

size_t getCarModelCount() {
    return kCarModelCount;
}

const CarModel* getCarModels() {
    return kCarModels;
}

const CarModel* findCarModel(const char* internalName) {
    if (internalName == nullptr) return nullptr;
    size_t nameLen = strlen(internalName);
    for (size_t i = 0; i < kCarModelCount; i++) {
        const char* candidate = kCarModels[i].internalName;
        if (strlen(candidate) == nameLen && equalsIgnoreCase(candidate, internalName, nameLen)) {
            return &kCarModels[i];
        }
    }
    return nullptr;
}

const CarModel* matchAdvertisedName(const char* advertisedName) {
    if (advertisedName == nullptr) return nullptr;
    size_t nameLen = strlen(advertisedName);
    if (nameLen == 0) return nullptr;

    const CarModel* best = nullptr;
    size_t bestLen = 0;

    for (size_t i = 0; i < kCarModelCount; i++) {
        const CarModel& model = kCarModels[i];
        if (!isAdvertisable(model)) continue;

        size_t patternLen = strlen(model.bluetoothName);
        if (patternLen == 0 || patternLen > nameLen) continue;
        if (!equalsIgnoreCase(advertisedName, model.bluetoothName, patternLen)) continue;

        if (patternLen == nameLen) {
            return &model;  // exact
        }
        if (patternLen > bestLen) {
            best = &model;
            bestLen = patternLen;
        }
    }
    return best;
}

bool isAdvertisable(const CarModel& model) {
    return model.bluetoothName != nullptr &&
           strcmp(model.bluetoothName, SLR_NOT_ADVERTISABLE) != 0;
}

const char* getCarLabel(const CarModel& model) {
    if (model.displayName == nullptr || model.displayName[0] == '\0') {
        return model.internalName;
    }
    return model.displayName;
}
