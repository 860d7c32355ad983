//
// Super Standard Template Library
//
// Copyright 1997-2005 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#include <globals.h>
#include <fcntl.h>

namespace superstl {
  ostream cout(1, 4096);
  ostream cerr(2, 0);

  int format_integer(char* buf, int bufsize, W64s v, bool issigned) {
    if (issigned)
      return snprintf(buf, bufsize, "%lld", v);
    else return snprintf(buf, bufsize, "%llu", (W64)v);
  }

  int format_float(char* buf, int bufsize, double v, int precision) {
    char format[32];
    snprintf(format, sizeof(format), "%%.%df", precision);
    snprintf(buf, bufsize, format, v);
    return strlen(buf);
  }

  //
  // stringbuf
  //
  void stringbuf::reset(int length) {
    if (buf && (buf != smallbuf)) delete[] buf;
    if (length <= stringbuf_smallbufsize) {
      length = stringbuf_smallbufsize;
      buf = smallbuf;
    } else {
      buf = new char[length];
    }
    this->length = length;
    p = buf;
    *p = 0;
  }

  stringbuf::~stringbuf() {
    if (buf && (buf != smallbuf)) delete[] buf;
    buf = null;
    p = null;
  }

  void stringbuf::resize(int newlength) {
    if unlikely (newlength <= length) return;
    int oldsize = size();
    char* newbuf = new char[newlength];
    memcpy(newbuf, buf, oldsize + 1);
    if (buf != smallbuf) delete[] buf;
    buf = newbuf;
    p = buf + oldsize;
    length = newlength;
  }

  void stringbuf::reserve(int extra) {
    // Always keep room for the terminating null
    if likely (remaining() > extra) return;
    int newlength = length * 2;
    while ((newlength - size()) <= extra) newlength *= 2;
    resize(newlength);
  }

  stringbuf& stringbuf::append(const char* s, int n) {
    reserve(n);
    memcpy(p, s, n);
    p += n;
    *p = 0;
    return *this;
  }

  //
  // ostream
  //
  ostream::ostream() {
    fd = -1;
    buf = null;
    bufsize = 0;
    tail = 0;
    chain = null;
    close_on_destroy = 1;
  }

  ostream::ostream(int fd, int bufsize) {
    this->fd = -1;
    buf = null;
    this->bufsize = 0;
    tail = 0;
    chain = null;
    close_on_destroy = 0;
    open(fd, bufsize);
  }

  ostream::ostream(const char* filename, bool append, int bufsize) {
    fd = -1;
    buf = null;
    this->bufsize = 0;
    tail = 0;
    chain = null;
    close_on_destroy = 1;
    open(filename, append, bufsize);
  }

  ostream::~ostream() {
    if (close_on_destroy) close(); else flush();
    if (buf) delete[] buf;
    buf = null;
  }

  bool ostream::open(const char* filename, bool append, int bufsize) {
    if (fd >= 0) close();
    fd = ::open(filename, O_WRONLY | O_CREAT | ((append) ? O_APPEND : O_TRUNC), 0644);
    if unlikely (fd < 0) return false;
    close_on_destroy = 1;
    setbuf(bufsize);
    return true;
  }

  bool ostream::open(int fd, int bufsize) {
    if (this->fd >= 0) close();
    this->fd = fd;
    setbuf(bufsize);
    return ok();
  }

  void ostream::close() {
    if (fd < 0) return;
    flush();
    if (close_on_destroy && (fd > 2)) ::close(fd);
    fd = -1;
  }

  int ostream::setbuf(int bufsize) {
    flush();
    if (buf) delete[] buf;
    buf = (bufsize > 0) ? new char[bufsize] : null;
    this->bufsize = bufsize;
    tail = 0;
    return bufsize;
  }

  void ostream::setchain(ostream* chain) {
    this->chain = chain;
  }

  int ostream::write(const void* data, int count) {
    if unlikely (chain) chain->write(data, count);
    if unlikely (fd < 0) return 0;

    if unlikely ((tail + count) > bufsize) {
      flush();
      if (count > bufsize) {
        int rc = ::write(fd, data, count);
        return (rc < 0) ? 0 : rc;
      }
    }

    memcpy(buf + tail, data, count);
    tail += count;
    return count;
  }

  void ostream::flush() {
    if unlikely (chain) chain->flush();
    if unlikely ((fd < 0) | (!tail)) return;
    int done = 0;
    while (done < tail) {
      int rc = ::write(fd, buf + done, tail - done);
      if unlikely (rc <= 0) break;
      done += rc;
    }
    tail = 0;
  }

  //
  // Formatting helpers
  //
  stringbuf& operator <<(stringbuf& os, const bitstring& bs) {
    foreach (i, bs.n) {
      int idx = (bs.reverse) ? ((bs.n-1) - i) : i;
      os << ((((bs.bits >> idx) & 1) != 0) ? '1' : '0');
    }
    return os;
  }

  stringbuf& operator <<(stringbuf& os, const hexstring& hs) {
    char buf[32];
    int digits = (hs.n + 3) / 4;
    snprintf(buf, sizeof(buf), "%0*llx", digits, (hs.value & bitmask64(hs.n)));
    return os << buf;
  }

  stringbuf& operator <<(stringbuf& os, const intstring& is) {
    char buf[64];
    if (is.width < 0)
      snprintf(buf, sizeof(buf), "%-*lld", -is.width, is.value);
    else snprintf(buf, sizeof(buf), "%*lld", is.width, is.value);
    return os << buf;
  }

  stringbuf& operator <<(stringbuf& os, const floatstring& fs) {
    char buf[128];
    snprintf(buf, sizeof(buf), "%*.*f", fs.width, fs.precision, fs.value);
    return os << buf;
  }

  stringbuf& operator <<(stringbuf& os, const padstring& s) {
    char buf[256];
    if (s.width < 0)
      snprintf(buf, sizeof(buf), "%-*s", -s.width, s.value);
    else snprintf(buf, sizeof(buf), "%*s", s.width, s.value);
    return os << buf;
  }
};
