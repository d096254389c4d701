#include "services/PackageDatabase.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

constexpr std::array KNOWN_PACKAGES{
    KnownPackage{"com.android.systemui", "System UI", SafetyLevel::DANGEROUS,
                 "Critical system component - manages UI, notifications, status bar", false},
    KnownPackage{"com.android.phone", "Phone", SafetyLevel::DANGEROUS,
                 "Required for phone calls and cellular functionality", false},
    KnownPackage{"com.android.settings", "Settings", SafetyLevel::DANGEROUS,
                 "System settings app - removing will break device configuration", false},
    KnownPackage{"com.android.launcher3", "Launcher", SafetyLevel::DANGEROUS,
                 "Default launcher - removing may prevent accessing home screen", false},
    KnownPackage{"com.android.vending", "Google Play Store", SafetyLevel::DANGEROUS,
                 "Required for app installation and updates", false},
    KnownPackage{"com.google.android.gms", "Google Play Services", SafetyLevel::EXPERT,
                 "Many apps depend on this - removing may break functionality", true},
    KnownPackage{"com.google.android.gsf", "Google Services Framework", SafetyLevel::EXPERT,
                 "Required for Google account sync and Play Store", true},
    KnownPackage{"com.android.bluetooth", "Bluetooth", SafetyLevel::EXPERT,
                 "Bluetooth functionality - removing disables BT completely", false},
    KnownPackage{"com.android.nfc", "NFC Service", SafetyLevel::EXPERT,
                 "Near-field communication - needed for contactless payments", false},
    KnownPackage{"com.android.providers.contacts", "Contacts Storage", SafetyLevel::EXPERT,
                 "Stores contacts data - removing may cause data loss", false},
    KnownPackage{"com.verizon.services", "Verizon Services", SafetyLevel::EXPERT,
                 "Carrier-specific services - may affect network features", true},
    KnownPackage{"com.att.myWireless", "AT&T MyWireless", SafetyLevel::EXPERT,
                 "AT&T account management - may affect carrier features", true},
    KnownPackage{"com.sprint.zone", "Sprint Zone", SafetyLevel::EXPERT,
                 "Sprint carrier app - may impact network services", true},
    KnownPackage{"com.facebook.katana", "Facebook", SafetyLevel::CAUTION,
                 "Pre-installed Facebook app - safe to remove but may be system app", true},
    KnownPackage{"com.facebook.services", "Facebook Services", SafetyLevel::CAUTION,
                 "Facebook background services - tracks usage", true},
    KnownPackage{"com.facebook.system", "Facebook App Manager", SafetyLevel::CAUTION,
                 "Facebook system integration - can be removed", true},
    KnownPackage{"com.instagram.android", "Instagram", SafetyLevel::CAUTION,
                 "Pre-installed Instagram - safe to remove", true},
    KnownPackage{"com.whatsapp", "WhatsApp", SafetyLevel::CAUTION,
                 "Pre-installed messaging app - can be reinstalled from Play Store", true},
    KnownPackage{"com.samsung.android.app.spage", "Samsung Free", SafetyLevel::CAUTION,
                 "Samsung news/content aggregator - safe to remove", true},
    KnownPackage{"com.samsung.android.bixby.agent", "Bixby Voice", SafetyLevel::CAUTION,
                 "Samsung voice assistant - safe to remove if not used", true},
    KnownPackage{"com.samsung.android.game.gametools", "Game Tools", SafetyLevel::CAUTION,
                 "Samsung gaming features - safe to remove if not gaming", true},
    KnownPackage{"com.sec.android.app.samsungapps", "Galaxy Store", SafetyLevel::CAUTION,
                 "Samsung app store - can be removed if using Play Store only", true},
    KnownPackage{"com.samsung.android.messaging", "Samsung Messages", SafetyLevel::CAUTION,
                 "Samsung SMS app - safe if using alternative messaging app", true},
    KnownPackage{"com.xiaomi.micloud.sdk", "Mi Cloud", SafetyLevel::CAUTION,
                 "Xiaomi cloud services - safe to remove if not using Mi account", true},
    KnownPackage{"com.miui.analytics", "MIUI Analytics", SafetyLevel::CAUTION,
                 "Xiaomi usage tracking - recommended to remove for privacy", true},
    KnownPackage{"com.miui.msa.global", "MIUI Ad Services", SafetyLevel::CAUTION,
                 "Xiaomi advertising service - safe to remove", true},
    KnownPackage{"com.huawei.appmarket", "Huawei AppGallery", SafetyLevel::CAUTION,
                 "Huawei app store - can be removed if using alternatives", true},
    KnownPackage{"com.oppo.market", "OPPO App Market", SafetyLevel::CAUTION,
                 "OPPO app store - safe to remove", true},
    KnownPackage{"com.google.android.apps.maps", "Google Maps", SafetyLevel::SAFE,
                 "Navigation app - easily reinstallable from Play Store", true},
    KnownPackage{"com.google.android.gm", "Gmail", SafetyLevel::SAFE,
                 "Email client - can be reinstalled from Play Store", true},
    KnownPackage{"com.google.android.youtube", "YouTube", SafetyLevel::SAFE,
                 "Video streaming app - easily reinstallable", true},
    KnownPackage{"com.google.android.apps.photos", "Google Photos", SafetyLevel::SAFE,
                 "Photo management app - can be reinstalled", true},
    KnownPackage{"com.google.android.apps.docs", "Google Drive", SafetyLevel::SAFE,
                 "Cloud storage app - reinstallable from Play Store", true},
    KnownPackage{"com.google.android.music", "Google Play Music", SafetyLevel::SAFE,
                 "Music player (deprecated) - safe to remove", true},
    KnownPackage{"com.google.android.videos", "Google Play Movies & TV", SafetyLevel::SAFE,
                 "Video streaming app - easily reinstallable", true},
    KnownPackage{"com.android.chrome", "Chrome Browser", SafetyLevel::SAFE,
                 "Web browser - can be reinstalled from Play Store", true},
    KnownPackage{"com.netflix.mediaclient", "Netflix", SafetyLevel::SAFE,
                 "Pre-installed streaming app - easily reinstallable", true},
    KnownPackage{"com.spotify.music", "Spotify", SafetyLevel::SAFE,
                 "Music streaming app - reinstallable from Play Store", true},
    KnownPackage{"com.microsoft.office.officehubrow", "Microsoft Office", SafetyLevel::SAFE,
                 "Office productivity app - can be reinstalled", true},
    KnownPackage{"com.android.calendar", "Calendar", SafetyLevel::SAFE,
                 "Calendar app - safe to remove if using alternative", true},
    KnownPackage{"com.android.calculator2", "Calculator", SafetyLevel::SAFE,
                 "Calculator app - easily replaceable", true},
    KnownPackage{"com.android.deskclock", "Clock", SafetyLevel::SAFE,
                 "Clock/timer/alarm app - safe to remove if using alternative", true},
    KnownPackage{"com.android.email", "Email", SafetyLevel::SAFE,
                 "Stock email client - safe to remove if using Gmail/Outlook", true},
    KnownPackage{"com.tiktok.android", "TikTok", SafetyLevel::CAUTION,
                 "Pre-installed social media app - tracks usage extensively", true},
    KnownPackage{"com.android.traceur", "System Tracing", SafetyLevel::CAUTION,
                 "Developer debugging tool - safe to remove for regular users", true},
    KnownPackage{"com.google.android.apps.turbo", "Device Health Services", SafetyLevel::CAUTION,
                 "Background optimization - may affect battery estimates", true},
    KnownPackage{"com.samsung.android.scloud", "Samsung Cloud", SafetyLevel::CAUTION,
                 "Samsung backup service - safe to remove if using Google backup", true},};

constexpr std::array SOCIAL_PATTERNS{"com.facebook", "com.instagram", "com.tiktok"};
constexpr std::array CORE_PATTERNS{"com.google.android.gms", "com.android.vending",
                                   "com.android.systemui"};
constexpr std::array VENDOR_PATTERNS{"com.samsung", "com.xiaomi", "com.miui",
                                     "com.huawei",  "com.oppo",   "com.vivo"};

template<size_t N>
auto matches_any(std::string_view package, const std::array<const char*, N>& patterns) -> bool {
    return std::ranges::any_of(patterns,
                               [package](const char* pattern) { return package.contains(pattern); });
}

auto capitalize(std::string_view word) -> std::string {
    std::string out(word);
    if (!out.empty()) {
        out.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(out.front())));
    }
    return out;
}

}  // namespace

auto PackageDatabase::find(std::string_view package) -> std::optional<KnownPackage> {
    auto it = std::ranges::find(KNOWN_PACKAGES, package, &KnownPackage::name);
    if (it == KNOWN_PACKAGES.end()) {
        return std::nullopt;
    }
    return *it;
}

auto PackageDatabase::safety_level(std::string_view package) -> SafetyLevel {
    if (auto known = find(package)) {
        return known->safety_level;
    }
    if (matches_any(package, SOCIAL_PATTERNS)) {
        return SafetyLevel::CAUTION;
    }
    if (matches_any(package, CORE_PATTERNS)) {
        return SafetyLevel::DANGEROUS;
    }
    if (matches_any(package, VENDOR_PATTERNS)) {
        return SafetyLevel::CAUTION;
    }
    return SafetyLevel::SAFE;
}

auto PackageDatabase::display_name(std::string_view package) -> std::string {
    if (auto known = find(package)) {
        return std::string(known->display_name);
    }

    const auto dot = package.rfind('.');
    auto last = dot == std::string_view::npos ? package : package.substr(dot + 1);

    std::string formatted;
    size_t start = 0;
    while (start <= last.size()) {
        auto end = last.find('_', start);
        if (end == std::string_view::npos) {
            end = last.size();
        }
        if (start > 0) {
            formatted += ' ';
        }
        formatted += capitalize(last.substr(start, end - start));
        start = end + 1;
    }
    return formatted;
}

auto PackageDatabase::safety_reason(std::string_view package) -> std::string {
    if (auto known = find(package)) {
        return std::string(known->reason);
    }
    return "No information available for this package.";
}

auto PackageDatabase::is_safe_to_remove(std::string_view package) -> bool {
    const auto level = safety_level(package);
    return level == SafetyLevel::SAFE || level == SafetyLevel::CAUTION;
}

auto PackageDatabase::is_system_app(std::string_view package) -> bool {
    return package.starts_with("com.android.") || package.starts_with("com.google.android.");
}

auto PackageDatabase::classify(std::string_view package) -> PackageRecord {
    return PackageRecord{.package_name = std::string(package),
                         .app_name = display_name(package),
                         .safety_level = safety_level(package)};
}

auto PackageDatabase::all() -> std::span<const KnownPackage> {
    return KNOWN_PACKAGES;
}
