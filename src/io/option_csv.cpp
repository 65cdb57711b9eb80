#include "bse/io/option_csv.hpp"
#include "bse/core/errors.hpp"
#include "bse/io/cli_args.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <optional>
#include <unordered_map>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](unsigned char ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// CSV splitter minimal qui gère les champs entre "..."
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// récupère index de colonne via map (synonymes acceptés)
static int col(const std::unordered_map<std::string,int>& idx, std::initializer_list<const char*> names) {
  for (auto* n: names) {
    auto it = idx.find(n);
    if (it != idx.end()) return it->second;
  }
  return -1;
}

} // namespace

namespace bse::io {

std::vector<OptionRow>
read_option_csv(std::istream& in,
                std::size_t* num_ignored,
                std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  std::vector<OptionRow> out;

  std::string line;
  std::size_t line_no = 0;
  bool header_seen = false;
  int iId=-1, iType=-1, iS=-1, iK=-1, iR=-1, iSig=-1, iT=-1;

  auto ignore = [&](const std::string& why) {
    if (num_ignored) (*num_ignored)++;
    if (warnings) warnings->push_back("line " + std::to_string(line_no) + ": " + why);
  };

  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);

    if (!header_seen) {
      header_seen = true;
      std::unordered_map<std::string,int> idx;
      for (int i=0;i<(int)cells.size();++i) idx[lower(cells[i])] = i;

      iId   = col(idx, {"id","symbol"});
      iType = col(idx, {"type","cp","callput"});
      iS    = col(idx, {"s","spot","s0"});
      iK    = col(idx, {"k","strike"});
      iR    = col(idx, {"r","rate"});
      iSig  = col(idx, {"sigma","vol","volatility"});
      iT    = col(idx, {"t","maturity","expiry"});
      continue;
    }

    auto get = [&](int i)->std::string {
      return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
    };

    OptionRow row;
    row.id = get(iId);

    const std::string type_txt = get(iType);
    if (!type_txt.empty() && !market::parse_option_type(type_txt, &row.type)) {
      ignore("unknown option type '" + type_txt + "'");
      continue;
    }

    // ---- Champs numériques ----
    struct Field { const char* name; int col; double* slot; };
    const Field fields[] = {
      {"S",     iS,   &row.params.S},
      {"K",     iK,   &row.params.K},
      {"r",     iR,   &row.params.r},
      {"sigma", iSig, &row.params.sigma},
      {"T",     iT,   &row.params.T},
    };
    std::optional<std::string> why;
    for (const auto& f : fields) {
      const std::string txt = get(f.col);
      const auto v = parse_number(txt);
      if (!v) { why = std::string(f.name) + " is not a number ('" + txt + "')"; break; }
      *f.slot = *v;
    }
    if (why) { ignore(*why); continue; }

    // ---- Domaine ----
    try {
      market::validate(row.params);
    } catch (const core::InvalidParameter& e) {
      ignore(e.what());
      continue;
    }

    out.push_back(row);
  }

  return out;
}

std::vector<OptionRow>
read_option_csv(const std::string& path,
                std::size_t* num_ignored,
                std::vector<std::string>* warnings)
{
  std::ifstream f(path);
  if (!f) {
    if (num_ignored) *num_ignored = 0;
    if (warnings) warnings->push_back("cannot open file: " + path);
    return {};
  }
  return read_option_csv(f, num_ignored, warnings);
}

} // namespace bse::io
