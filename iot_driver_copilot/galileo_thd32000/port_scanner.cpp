#include "port_scanner.h"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>

static const char* const kKnownVendors[] = {
    "0403",  // FTDI
    "10c4",  // Silicon Labs CP210x
    "067b",  // Prolific PL2303
    "1a86",  // WCH CH340
    "04d8",  // Microchip (CDC firmware)
    "0483",  // STMicroelectronics (CDC firmware)
};

bool is_known_vendor(const std::string& vendor_id) {
    std::string v = vendor_id;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    for (const char* known : kKnownVendors) {
        if (v == known) return true;
    }
    return false;
}

static bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

static bool path_exists(const std::string& p) {
    struct stat st;
    return ::stat(p.c_str(), &st) == 0;
}

static std::string read_sysfs_line(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "";
    std::string line;
    std::getline(f, line);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

PortScanner::PortScanner() : dev_dir_("/dev"), sys_tty_dir_("/sys/class/tty") {}

PortScanner::PortScanner(const std::string& dev_dir, const std::string& sys_tty_dir)
: dev_dir_(dev_dir), sys_tty_dir_(sys_tty_dir) {}

bool PortScanner::readUsbInfo(const std::string& name, PortCandidate& pc) const {
    // ttyACM: device -> interface, idVendor one level up.
    // ttyUSB: device -> usb-serial port, idVendor two levels up.
    static const char* const kLevels[] = {"/device", "/device/..", "/device/../.."};
    for (const char* level : kLevels) {
        std::string dir = sys_tty_dir_ + "/" + name + level;
        std::string vid = read_sysfs_line(dir + "/idVendor");
        if (vid.empty()) continue;
        pc.vendor_id = vid;
        pc.product_id = read_sysfs_line(dir + "/idProduct");
        pc.manufacturer = read_sysfs_line(dir + "/manufacturer");
        pc.product = read_sysfs_line(dir + "/product");
        return true;
    }
    return false;
}

bool PortScanner::isPlaceholderUart(const std::string& name) const {
    std::string dev = sys_tty_dir_ + "/" + name + "/device";
    if (!path_exists(dev)) return true;

    // serial8250 registers ttyS0..31 whether or not a UART is fitted
    char target[512];
    ssize_t n = ::readlink((dev + "/driver").c_str(), target, sizeof(target) - 1);
    if (n <= 0) return false;
    target[n] = '\0';
    const char* base = std::strrchr(target, '/');
    return std::strcmp(base ? base + 1 : target, "serial8250") == 0;
}

static int prefix_order(const std::string& name) {
    if (starts_with(name, "ttyACM")) return 0;
    if (starts_with(name, "ttyUSB")) return 1;
    return 2;
}

static long numeric_suffix(const std::string& name) {
    size_t i = name.size();
    while (i > 0 && std::isdigit((unsigned char)name[i - 1])) --i;
    if (i == name.size()) return -1;
    return std::strtol(name.c_str() + i, nullptr, 10);
}

std::vector<PortCandidate> PortScanner::listCandidates() const {
    std::vector<PortCandidate> result;

    DIR* dir = opendir(dev_dir_.c_str());
    if (!dir) return result;

    struct dirent* ent;
    while ((ent = readdir(dir)) != nullptr) {
        std::string name = ent->d_name;
        bool usb = starts_with(name, "ttyACM") || starts_with(name, "ttyUSB");
        bool legacy = !usb && starts_with(name, "ttyS");
        if (!usb && !legacy) continue;
        if (numeric_suffix(name) < 0) continue;

        PortCandidate pc;
        pc.name = name;
        pc.device = dev_dir_ + "/" + name;

        if (usb) {
            bool has_usb_info = readUsbInfo(name, pc);
            pc.rank = has_usb_info && is_known_vendor(pc.vendor_id) ? 0 : 1;
        } else {
            if (isPlaceholderUart(name)) continue;
            pc.rank = 2;
        }
        result.push_back(pc);
    }
    closedir(dir);

    std::sort(result.begin(), result.end(), [](const PortCandidate& a, const PortCandidate& b) {
        if (a.rank != b.rank) return a.rank < b.rank;
        int pa = prefix_order(a.name), pb = prefix_order(b.name);
        if (pa != pb) return pa < pb;
        return numeric_suffix(a.name) < numeric_suffix(b.name);
    });
    return result;
}
