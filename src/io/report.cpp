#include <bse/io/report.hpp>

#include <iomanip>
#include <ostream>
#include <sstream>

namespace bse::io {

std::string format_report(const pricing::BsReport& rep, int precision) {
  std::ostringstream os;
  os.setf(std::ios::fixed);
  os << std::setprecision(precision);
  os << "Call Price: " << rep.call_price << "\n"
     << "Put Price: "  << rep.put_price  << "\n"
     << "Call Delta: " << rep.call_delta << "\n"
     << "Put Delta: "  << rep.put_delta  << "\n";
  return os.str();
}

void write_report(std::ostream& os, const pricing::BsReport& rep, int precision) {
  os << format_report(rep, precision);
}

} // namespace bse::io
