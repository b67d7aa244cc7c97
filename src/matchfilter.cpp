#include <devnotify/matchfilter.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace devnotify {

MatchFilter::MatchFilter (const std::string& providerClass) {
    mEntries[kProviderClassKey] = providerClass;
}

MatchFilter& MatchFilter::set (const std::string& key, const std::string& value) {
    mEntries[key] = value;
    return *this;
}

MatchFilter& MatchFilter::set (const std::string& key, const char* value) {
    // Without this overload a string literal would convert to bool, then to int64_t.
    return set(key, std::string(value));
}

MatchFilter& MatchFilter::setInteger (const std::string& key, std::int64_t value) {
    if (key == kProviderClassKey) {
        throw std::invalid_argument(std::string(kProviderClassKey) + " must be a class name");
    }
    mEntries[key] = value;
    return *this;
}

std::string MatchFilter::providerClass () const {
    auto it = mEntries.find(kProviderClassKey);
    if (it != mEntries.end()) {
        if (auto s = boost::get<std::string>(&it->second)) {
            return *s;
        }
    }
    return {};
}

boost::optional<FilterValue> MatchFilter::find (const std::string& key) const {
    auto it = mEntries.find(key);
    if (it == mEntries.end()) {
        return boost::none;
    }
    return it->second;
}

namespace {

struct PrintValue : boost::static_visitor<void> {
    std::ostream& os;
    explicit PrintValue (std::ostream& o) : os(o) {}
    void operator() (const std::string& s) const { os << '\'' << s << '\''; }
    void operator() (std::int64_t i) const {
        std::ostringstream hex;
        hex << "0x" << std::hex << std::setfill('0') << std::setw(4) << i;
        os << hex.str();
    }
};

} // <anonymous>

std::ostream& operator<< (std::ostream& os, const MatchFilter& filter) {
    os << '{';
    auto first = true;
    for (const auto& entry : filter) {
        if (!first) {
            os << ", ";
        }
        first = false;
        os << entry.first << ": ";
        boost::apply_visitor(PrintValue{os}, entry.second);
    }
    return os << '}';
}

bool operator== (const MatchFilter& a, const MatchFilter& b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
}

} // namespace devnotify
