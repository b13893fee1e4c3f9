#include "decimal.hpp"

// libmpdec is only included here; the rest of the code goes through Decimal.
#include <mpdecimal.h>

#include <new>
#include <stdexcept>
#include <string>

namespace {

const mpd_context_t& context() {
  static const mpd_context_t ctx = [] {
    mpd_context_t c;
    mpd_defaultcontext(&c);
    return c;
  }();
  return ctx;
}

mpd_t* newValue() {
  mpd_t* v = mpd_qnew();
  if (!v) throw std::bad_alloc();
  return v;
}

void checkStatus(uint32_t status) {
  if (status & MPD_Malloc_error) throw std::bad_alloc();
  if (status & MPD_Division_by_zero) throw std::domain_error("decimal division by zero");
  if (status & MPD_Invalid_operation) throw std::domain_error("invalid decimal operation");
}

} // namespace

Decimal::Decimal() : Decimal(int64_t{0}) {}

Decimal::Decimal(int64_t value) : value_(newValue()) {
  uint32_t status = 0;
  mpd_qset_i64(value_, value, &context(), &status);
  if (status & MPD_Malloc_error) {
    mpd_del(value_);
    throw std::bad_alloc();
  }
}

Decimal::Decimal(const Decimal& other) : value_(newValue()) {
  uint32_t status = 0;
  if (!mpd_qcopy(value_, other.value_, &status)) {
    mpd_del(value_);
    throw std::bad_alloc();
  }
}

Decimal& Decimal::operator=(const Decimal& other) {
  if (this != &other) {
    uint32_t status = 0;
    if (!mpd_qcopy(value_, other.value_, &status)) throw std::bad_alloc();
  }
  return *this;
}

Decimal::~Decimal() {
  mpd_del(value_);
}

Decimal Decimal::fromString(const std::string& text) {
  Decimal d;
  uint32_t status = 0;
  mpd_qset_string(d.value_, text.c_str(), &context(), &status);
  if (status & MPD_Malloc_error) throw std::bad_alloc();
  if ((status & MPD_Conversion_syntax) || mpd_isspecial(d.value_)) {
    throw std::invalid_argument("not a decimal number: '" + text + "'");
  }
  return d;
}

Decimal Decimal::operator+(const Decimal& rhs) const {
  Decimal r;
  uint32_t status = 0;
  mpd_qadd(r.value_, value_, rhs.value_, &context(), &status);
  checkStatus(status);
  return r;
}

Decimal Decimal::operator-(const Decimal& rhs) const {
  Decimal r;
  uint32_t status = 0;
  mpd_qsub(r.value_, value_, rhs.value_, &context(), &status);
  checkStatus(status);
  return r;
}

Decimal Decimal::operator*(const Decimal& rhs) const {
  Decimal r;
  uint32_t status = 0;
  mpd_qmul(r.value_, value_, rhs.value_, &context(), &status);
  checkStatus(status);
  return r;
}

Decimal Decimal::operator/(const Decimal& rhs) const {
  if (rhs.isZero()) throw std::domain_error("decimal division by zero");
  Decimal r;
  uint32_t status = 0;
  mpd_qdiv(r.value_, value_, rhs.value_, &context(), &status);
  checkStatus(status);
  return r;
}

Decimal Decimal::operator-() const {
  Decimal r;
  uint32_t status = 0;
  mpd_qminus(r.value_, value_, &context(), &status);
  checkStatus(status);
  return r;
}

Decimal& Decimal::operator+=(const Decimal& rhs) {
  *this = *this + rhs;
  return *this;
}

Decimal& Decimal::operator-=(const Decimal& rhs) {
  *this = *this - rhs;
  return *this;
}

Decimal Decimal::abs() const {
  Decimal r;
  uint32_t status = 0;
  mpd_qabs(r.value_, value_, &context(), &status);
  checkStatus(status);
  return r;
}

bool Decimal::isZero() const {
  return mpd_iszero(value_) != 0;
}

bool Decimal::isNegative() const {
  return !isZero() && mpd_isnegative(value_) != 0;
}

Decimal Decimal::rescaled(int places) const {
  Decimal r;
  uint32_t status = 0;
  mpd_qrescale(r.value_, value_, -static_cast<mpd_ssize_t>(places), &context(), &status);
  checkStatus(status);
  return r;
}

int Decimal::compare(const Decimal& rhs) const {
  uint32_t status = 0;
  return mpd_qcmp(value_, rhs.value_, &status);
}

std::string Decimal::toString() const {
  char* s = mpd_to_sci(value_, 0);
  if (!s) throw std::bad_alloc();
  std::string out(s);
  mpd_free(s);
  return out;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
  return os << value.toString();
}
