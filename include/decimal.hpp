#pragma once

#include <cstdint>
#include <ostream>
#include <string>

struct mpd_t;

// Exact decimal number backed by libmpdec.
// Arithmetic uses a shared read-only 38-digit context, so values can be used
// from several threads at once as long as each object is not shared mutably.
class Decimal {
public:
  Decimal();
  explicit Decimal(int64_t value);
  Decimal(const Decimal& other);
  Decimal& operator=(const Decimal& other);
  ~Decimal();

  // Throws std::invalid_argument if text is not a decimal literal.
  static Decimal fromString(const std::string& text);

  Decimal operator+(const Decimal& rhs) const;
  Decimal operator-(const Decimal& rhs) const;
  Decimal operator*(const Decimal& rhs) const;
  // Throws std::domain_error on division by zero.
  Decimal operator/(const Decimal& rhs) const;
  Decimal operator-() const;

  Decimal& operator+=(const Decimal& rhs);
  Decimal& operator-=(const Decimal& rhs);

  Decimal abs() const;
  bool isZero() const;
  bool isNegative() const;

  // Rounds half-even to exactly `places` fractional digits.
  Decimal rescaled(int places) const;

  int compare(const Decimal& rhs) const;

  std::string toString() const;

private:
  mpd_t* value_;
};

inline bool operator==(const Decimal& a, const Decimal& b) { return a.compare(b) == 0; }
inline bool operator!=(const Decimal& a, const Decimal& b) { return a.compare(b) != 0; }
inline bool operator<(const Decimal& a, const Decimal& b) { return a.compare(b) < 0; }
inline bool operator>(const Decimal& a, const Decimal& b) { return a.compare(b) > 0; }
inline bool operator<=(const Decimal& a, const Decimal& b) { return a.compare(b) <= 0; }
inline bool operator>=(const Decimal& a, const Decimal& b) { return a.compare(b) >= 0; }

std::ostream& operator<<(std::ostream& os, const Decimal& value);
