#ifndef PORT_SCANNER_H
#define PORT_SCANNER_H

#include <string>
#include <vector>

struct PortCandidate {
    std::string device;        // e.g. /dev/ttyACM0
    std::string name;          // e.g. ttyACM0
    std::string vendor_id;     // USB idVendor, lowercase hex, empty if unknown
    std::string product_id;
    std::string manufacturer;
    std::string product;
    int rank = 2;              // 0 known bridge vendor, 1 other USB, 2 legacy UART
};

// True for USB vendor ids of serial bridges the THD 32000 ships with or
// is commonly cabled through.
bool is_known_vendor(const std::string& vendor_id);

// Lists serial ports, most likely first. Never opens a device node; rescans
// on every call. Roots are injectable for tests.
class PortScanner {
public:
    PortScanner();
    PortScanner(const std::string& dev_dir, const std::string& sys_tty_dir);

    std::vector<PortCandidate> listCandidates() const;

private:
    bool readUsbInfo(const std::string& name, PortCandidate& pc) const;
    bool isPlaceholderUart(const std::string& name) const;

    std::string dev_dir_;
    std::string sys_tty_dir_;
};

#endif // PORT_SCANNER_H
