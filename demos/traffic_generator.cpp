// Traffic Generator Demo
//
// Simulates a contest station's logger broadcasting N1MM+ messages.
//
// Usage:
//   ./traffic_generator [host] [port] [--tcp] [--burst N] [--chaos]
//
// Options:
//   host    - Target host (default: 127.0.0.1)
//   port    - Target port (default: 12060)
//   --tcp   - One connection per message instead of UDP datagrams
//   --burst - Send N contacts back to back, then exit (trips the rate limiter)
//   --chaos - Mix in malformed XML, unknown tags, incomplete contacts and
//             oversized payloads

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int /*signum*/) {
    g_running = false;
}

// Simple random number generator
class Random {
public:
    Random() : gen_(std::random_device{}()) {}

    int range(int min, int max) {
        std::uniform_int_distribution<int> dist(min, max);
        return dist(gen_);
    }

    double uniform() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(gen_);
    }

    template<typename T>
    const T& pick(const std::vector<T>& vec) {
        return vec[range(0, static_cast<int>(vec.size()) - 1)];
    }

private:
    std::mt19937 gen_;
};

const std::vector<std::string> CALLS = {
    "K1ABC", "W2XYZ", "DL1AA", "G4BBB", "JA1CCC", "VK2DDD",
    "PY2EEE", "ZS6FFF", "OH2GGG", "UA3HHH", "EA5III", "VE3JJJ"
};

const std::vector<std::string> MODES = {"CW", "SSB", "FT8", "RTTY"};

struct Band {
    const char* name;
    int low_khz;
    int high_khz;
};

const std::vector<Band> BANDS = {
    {"3.5", 3500, 3600}, {"7", 7000, 7100}, {"14", 14000, 14100},
    {"21", 21000, 21100}, {"28", 28000, 28100}
};

const char* kStation = "CONTEST-PC1";
const char* kOperator = "N0OPR";

// "yyyy-MM-dd HH:mm:ss" in UTC
std::string now_timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

std::string make_contact(Random& rng, const char* root, int serial) {
    const Band& band = rng.pick(BANDS);
    const std::string& mode = rng.pick(MODES);
    const int freq = rng.range(band.low_khz, band.high_khz) * 100;  // 10 Hz units

    std::string xml = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
    xml += "<" + std::string(root) + ">";
    xml += "<app>N1MM</app>";
    xml += "<contestname>CQWWCW</contestname>";
    xml += "<contestnr>1</contestnr>";
    xml += "<timestamp>" + now_timestamp() + "</timestamp>";
    xml += "<mycall>N0CALL</mycall>";
    xml += "<band>" + std::string(band.name) + "</band>";
    xml += "<rxfreq>" + std::to_string(freq) + "</rxfreq>";
    xml += "<txfreq>" + std::to_string(freq) + "</txfreq>";
    xml += "<operator>" + std::string(kOperator) + "</operator>";
    xml += "<mode>" + mode + "</mode>";
    xml += "<call>" + rng.pick(CALLS) + "</call>";
    xml += "<snt>599</snt><sntnr>" + std::to_string(serial) + "</sntnr>";
    xml += "<rcv>599</rcv><rcvnr>" + std::to_string(rng.range(1, 2000)) + "</rcvnr>";
    xml += "<zone>" + std::to_string(rng.range(1, 40)) + "</zone>";
    xml += "<IsOriginal>True</IsOriginal>";
    xml += "<StationName>" + std::string(kStation) + "</StationName>";
    xml += "<ID>" + std::to_string(rng.range(100000, 999999)) + "</ID>";
    xml += "</" + std::string(root) + ">";
    return xml;
}

std::string make_radio_info(Random& rng) {
    const Band& band = rng.pick(BANDS);
    std::string xml = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n<RadioInfo>";
    xml += "<app>N1MM</app>";
    xml += "<StationName>" + std::string(kStation) + "</StationName>";
    xml += "<RadioNr>1</RadioNr>";
    xml += "<Freq>" + std::to_string(rng.range(band.low_khz, band.high_khz) * 100) + "</Freq>";
    xml += "<Mode>" + rng.pick(MODES) + "</Mode>";
    xml += "<OpCall>" + std::string(kOperator) + "</OpCall>";
    xml += "<IsRunning>" + std::string(rng.uniform() < 0.5 ? "True" : "False") + "</IsRunning>";
    xml += "<IsTransmitting>" + std::string(rng.uniform() < 0.2 ? "True" : "False") + "</IsTransmitting>";
    xml += "<AuxAntSelected>-1</AuxAntSelected>";
    xml += "<IsConnected>True</IsConnected>";
    xml += "</RadioInfo>";
    return xml;
}

std::string make_spot(Random& rng) {
    const Band& band = rng.pick(BANDS);
    std::string xml = "<spot>";
    xml += "<app>N1MM</app>";
    xml += "<StationName>" + std::string(kStation) + "</StationName>";
    xml += "<dxcall>" + rng.pick(CALLS) + "</dxcall>";
    xml += "<frequency>" + std::to_string(rng.range(band.low_khz, band.high_khz)) + ",5</frequency>";
    xml += "<spottercall>" + rng.pick(CALLS) + "</spottercall>";
    xml += "<timestamp>" + now_timestamp() + "</timestamp>";
    xml += "<action>add</action><mode>" + rng.pick(MODES) + "</mode>";
    xml += "</spot>";
    return xml;
}

std::string make_app_info() {
    return "<AppInfo><app>N1MM</app><dbname>contest.s3db</dbname><contestnr>1</contestnr>"
           "<contestname>CQWWCW</contestname><StationName>" + std::string(kStation) +
           "</StationName></AppInfo>";
}

std::string make_score(Random& rng) {
    std::string xml = "<dynamicresults><contest>CQWWCW</contest><call>N0CALL</call>";
    xml += "<class power=\"HIGH\" assisted=\"NONASSISTED\" transmitter=\"ONE\" ops=\"SINGLE-OP\"/>";
    xml += "<qth><dxcccountry>K</dxcccountry><cqzone>5</cqzone><iaruzone>8</iaruzone></qth>";
    xml += "<breakdown>";
    int score = 0;
    for (const Band& band : BANDS) {
        const int qsos = rng.range(0, 300);
        score += qsos * 3;
        xml += "<qso band=\"" + std::string(band.name) + "\" mode=\"ALL\">" + std::to_string(qsos) + "</qso>";
    }
    xml += "</breakdown>";
    xml += "<score>" + std::to_string(score) + "</score>";
    xml += "<timestamp>" + now_timestamp() + "</timestamp>";
    xml += "</dynamicresults>";
    return xml;
}

// ============================================================================
// Chaos mode: Generate problematic traffic
// ============================================================================

std::string make_chaos(Random& rng) {
    switch (rng.range(0, 4)) {
        case 0:
            return "<contactinfo><call>K1ABC</call><mode>CW";       // unterminated
        case 1:
            return "<qsoparty><call>K1ABC</call></qsoparty>";        // unknown tag
        case 2:
            // Missing call: decodes, fails validation
            return "<contactinfo><timestamp>" + now_timestamp() +
                   "</timestamp><mode>CW</mode><StationName>X</StationName></contactinfo>";
        case 3:
            return "<RadioInfo><Freq>fourteen</Freq></RadioInfo>";   // bad number
        default:
            return "<spot><comment>" + std::string(4000, 'X') + "</comment></spot>";  // oversized for UDP
    }
}

// Statistics
struct Stats {
    std::uint64_t contacts_sent = 0;
    std::uint64_t status_sent = 0;
    std::uint64_t chaos_sent = 0;
    std::uint64_t send_errors = 0;
};

void print_stats(const Stats& stats) {
    std::fprintf(stderr, "--- Generator Stats ---\n");
    std::fprintf(stderr, "Contacts sent: %lu\n", stats.contacts_sent);
    std::fprintf(stderr, "Status sent:   %lu\n", stats.status_sent);
    std::fprintf(stderr, "Chaos sent:    %lu\n", stats.chaos_sent);
    std::fprintf(stderr, "Send errors:   %lu\n", stats.send_errors);
    std::fprintf(stderr, "-----------------------\n");
}

class Sender {
public:
    Sender(const sockaddr_in& dest, bool tcp) : dest_(dest), tcp_(tcp) {
        if (!tcp_) {
            udp_fd_ = socket(AF_INET, SOCK_DGRAM, 0);
        }
    }

    ~Sender() {
        if (udp_fd_ >= 0) {
            close(udp_fd_);
        }
    }

    Sender(const Sender&) = delete;
    Sender& operator=(const Sender&) = delete;

    [[nodiscard]] bool ready() const noexcept { return tcp_ || udp_fd_ >= 0; }

    bool send(const std::string& payload) {
        if (!tcp_) {
            ssize_t sent = sendto(udp_fd_, payload.data(), payload.size(), 0,
                                  reinterpret_cast<const sockaddr*>(&dest_), sizeof(dest_));
            return sent >= 0;
        }

        // One message per connection; closing the write side ends the read
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            return false;
        }
        bool ok = connect(fd, reinterpret_cast<const sockaddr*>(&dest_), sizeof(dest_)) == 0;
        std::size_t offset = 0;
        while (ok && offset < payload.size()) {
            ssize_t n = ::send(fd, payload.data() + offset, payload.size() - offset, MSG_NOSIGNAL);
            if (n <= 0) {
                ok = false;
            } else {
                offset += static_cast<std::size_t>(n);
            }
        }
        shutdown(fd, SHUT_WR);
        close(fd);
        return ok;
    }

private:
    sockaddr_in dest_;
    bool tcp_;
    int udp_fd_ = -1;
};

}  // namespace

int main(int argc, char* argv[]) {
    // Parse arguments
    const char* host = "127.0.0.1";
    std::uint16_t port = 12060;
    bool tcp_mode = false;
    bool chaos_mode = false;
    int burst = 0;
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--chaos") == 0) {
            chaos_mode = true;
        } else if (std::strcmp(argv[i], "--tcp") == 0) {
            tcp_mode = true;
        } else if (std::strcmp(argv[i], "--burst") == 0 && i + 1 < argc) {
            burst = std::atoi(argv[++i]);
        } else if (argv[i][0] != '-' && positional == 0) {
            host = argv[i];
            ++positional;
        } else if (argv[i][0] != '-' && positional == 1) {
            port = static_cast<std::uint16_t>(std::atoi(argv[i]));
            ++positional;
        }
    }

    std::fprintf(stderr, "Traffic generator targeting %s:%u over %s%s\n",
                 host, port, tcp_mode ? "TCP" : "UDP", chaos_mode ? " (chaos mode)" : "");

    // Set up signal handler
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Set up destination address
    sockaddr_in dest_addr{};
    dest_addr.sin_family = AF_INET;
    dest_addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host, &dest_addr.sin_addr) <= 0) {
        std::fprintf(stderr, "Invalid address: %s\n", host);
        return EXIT_FAILURE;
    }

    Sender sender(dest_addr, tcp_mode);
    if (!sender.ready()) {
        std::fprintf(stderr, "Failed to create socket\n");
        return EXIT_FAILURE;
    }

    Random rng;
    Stats stats;
    int serial = 1;

    if (burst > 0) {
        std::fprintf(stderr, "Bursting %d contacts\n", burst);
        for (int i = 0; i < burst && g_running; ++i) {
            if (sender.send(make_contact(rng, "contactinfo", serial++))) {
                ++stats.contacts_sent;
            } else {
                ++stats.send_errors;
            }
        }
        print_stats(stats);
        return EXIT_SUCCESS;
    }

    if (!sender.send(make_app_info())) {
        ++stats.send_errors;
    }

    auto last_stats_time = std::chrono::steady_clock::now();

    std::fprintf(stderr, "Generating traffic. Press Ctrl+C to stop.\n\n");

    while (g_running) {
        std::string payload;
        bool is_contact = false;
        bool is_chaos = false;

        if (chaos_mode && rng.uniform() < 0.2) {
            payload = make_chaos(rng);
            is_chaos = true;
        } else {
            const double roll = rng.uniform();
            if (roll < 0.5) {
                payload = make_radio_info(rng);
            } else if (roll < 0.75) {
                payload = make_contact(rng, rng.uniform() < 0.9 ? "contactinfo" : "contactreplace", serial++);
                is_contact = true;
            } else if (roll < 0.9) {
                payload = make_spot(rng);
            } else {
                payload = make_score(rng);
            }
        }

        if (!sender.send(payload)) {
            ++stats.send_errors;
        } else if (is_chaos) {
            ++stats.chaos_sent;
        } else if (is_contact) {
            ++stats.contacts_sent;
        } else {
            ++stats.status_sent;
        }

        // Print stats every 5 seconds
        auto now = std::chrono::steady_clock::now();
        if (now - last_stats_time >= std::chrono::seconds(5)) {
            print_stats(stats);
            last_stats_time = now;
        }

        // ~40 messages per minute: stays under the default per-source limit
        std::this_thread::sleep_for(std::chrono::milliseconds(rng.range(1000, 2000)));
    }

    std::fprintf(stderr, "\nShutting down...\n");
    print_stats(stats);
    return EXIT_SUCCESS;
}
