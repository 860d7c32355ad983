// -*- c++ -*-
//
// Super Standard Template Library
//
// Lightweight formatted output, string buffers and fixed size
// bit vectors used throughout the simulator.
//
// Copyright 1997-2005 Matt T. Yourst <yourst@yourst.com>
//
// This program is free software; it is licensed under the
// GNU General Public License, Version 2.
//

#ifndef _SUPERSTL_H_
#define _SUPERSTL_H_

namespace superstl {
  //
  // Formatting primitives (superstl.cpp)
  //
  int format_integer(char* buf, int bufsize, W64s v, bool issigned);
  int format_float(char* buf, int bufsize, double v, int precision);

  //
  // String buffer
  //

#define stringbuf_smallbufsize 256

  class stringbuf {
  public:
    stringbuf() { buf = null; reset(); }

    stringbuf(int length) {
      buf = null;
      reset(length);
    }

    stringbuf(const stringbuf& sb) {
      buf = null;
      reset(sb.size() + 1);
      append(sb.buf, sb.size());
    }

    ~stringbuf();

    void reset(int length = stringbuf_smallbufsize);

    int remaining() const {
      return (buf + length) - p;
    }

    operator char*() const {
      return buf;
    }

    void resize(int newlength);

    void reserve(int extra);

    stringbuf& append(const char* s, int n);

    int size() const { return p - buf; }
    bool empty() const { return (size() == 0); }
    bool set() const { return !empty(); }

    stringbuf& operator =(const char* str) {
      if unlikely (!str) {
        reset();
        return *this;
      }
      reset(strlen(str)+1);
      return append(str, strlen(str));
    }

    stringbuf& operator =(const stringbuf& sb) {
      if unlikely (&sb == this) return *this;
      reset(sb.size() + 1);
      return append(sb.buf, sb.size());
    }

    bool operator ==(const char* s) const {
      return (strcmp(buf, s) == 0);
    }

    bool operator !=(const char* s) const {
      return (strcmp(buf, s) != 0);
    }

  public:
    char smallbuf[stringbuf_smallbufsize];
    char* buf;
    char* p;
    int length;
  };

  //
  // Inserters
  //

  static inline stringbuf& operator <<(stringbuf& os, const char* v) {
    return os.append(v, strlen(v));
  }

  static inline stringbuf& operator <<(stringbuf& os, const char v) {
    return os.append(&v, 1);
  }

#define DefineIntegerInserter(T, signedtype) \
  static inline stringbuf& operator <<(stringbuf& os, const T v) { \
    char buf[64]; \
    format_integer(buf, sizeof(buf), (W64s)v, signedtype); \
    return os << buf; \
  }

  DefineIntegerInserter(signed short, 1);
  DefineIntegerInserter(signed int, 1);
  DefineIntegerInserter(signed long, 1);
  DefineIntegerInserter(signed long long, 1);
  DefineIntegerInserter(unsigned short, 0);
  DefineIntegerInserter(unsigned int, 0);
  DefineIntegerInserter(unsigned long, 0);
  DefineIntegerInserter(unsigned long long, 0);

#undef DefineIntegerInserter

#define DefineFloatInserter(T, digits) \
  static inline stringbuf& operator <<(stringbuf& os, const T v) { \
    char buf[128]; \
    format_float(buf, sizeof(buf), v, digits); \
    return os << buf; \
  }

  DefineFloatInserter(float, 6);
  DefineFloatInserter(double, 6);

#undef DefineFloatInserter

  static inline stringbuf& operator <<(stringbuf& os, const bool v) {
    return os << (int)v;
  }

  static inline stringbuf& operator <<(stringbuf& os, const stringbuf& sb) {
    return os.append(sb.buf, sb.size());
  }

  template <class T>
  static inline stringbuf& operator <<(stringbuf& os, const T* v) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%p", (const void*)v);
    return os << buf;
  }

  //
  // A much more intuitive syntax than STL provides:
  //
  template <class T>
  static inline stringbuf& operator ,(stringbuf& os, const T& v) {
    return os << v;
  }

  //
  // ostream class
  //
  static const char endl[] = "\n";
  static class iosflush { } flush;

  class ostream {
  protected:
    int fd;
    char* buf;
    int bufsize;
    int tail;
    ostream* chain;
  public:
    bool close_on_destroy;

    ostream();

    ostream(int fd, int bufsize = 65536);

    ostream(const char* filename, bool append = false, int bufsize = 65536);

    ~ostream();

    bool open(const char* filename, bool append = false, int bufsize = 65536);

    bool open(int fd, int bufsize = 65536);

    void close();

    int setbuf(int bufsize);

    void setchain(ostream* chain);

    int write(const void* data, int count);

    void flush();

    operator bool() const {
      return ok();
    }

    bool ok() const {
      return (fd >= 0);
    }

    int filehandle() const {
      return fd;
    }

  private:
    ostream(const ostream&);
    ostream& operator =(const ostream&);
  };

  extern ostream cout;
  extern ostream cerr;

  //
  // Inserters
  //

  template <typename T>
  static inline ostream& operator <<(ostream& os, const T& v) {
    stringbuf sb;
    sb << v;
    os.write((char*)sb, sb.size());
    return os;
  }

  static inline ostream& operator <<(ostream& os, const iosflush& v) {
    os.flush();
    return os;
  }

  static inline ostream& operator <<(ostream& os, const char v) {
    os.write(&v, sizeof(char));
    return os;
  }

  static inline ostream& operator <<(ostream& os, const char* v) {
    os.write(v, strlen(v));
    return os;
  }

  static inline ostream& operator <<(ostream& os, const stringbuf& v) {
    os.write((char*)v, v.size());
    return os;
  }

  template <class T>
  static inline ostream& operator ,(ostream& os, const T& v) {
    return os << v;
  }

  //
  // Formatting helpers
  //

  // Print bits as a string, lowest bit first:
  struct bitstring {
    W64 bits;
    int n;
    bool reverse;

    bitstring() { }

    bitstring(const W64 bits, const int n, bool reverse = false) {
      this->bits = bits;
      this->n = n;
      this->reverse = reverse;
    }
  };

  stringbuf& operator <<(stringbuf& os, const bitstring& bs);

  struct hexstring {
    W64 value;
    int n;

    hexstring() { }

    hexstring(const W64 value, const int n) {
      this->value = value;
      this->n = n;
    }
  };

  stringbuf& operator <<(stringbuf& os, const hexstring& hs);

  // Negative width means left justified:
  struct intstring {
    W64s value;
    int width;

    intstring() { }

    intstring(W64s value, int width) {
      this->value = value;
      this->width = width;
    }
  };

  stringbuf& operator <<(stringbuf& os, const intstring& is);

  struct floatstring {
    double value;
    int width;
    int precision;

    floatstring() { }

    floatstring(double value, int width = 0, int precision = 6) {
      this->value = value;
      this->width = width;
      this->precision = precision;
    }
  };

  stringbuf& operator <<(stringbuf& os, const floatstring& fs);

  struct padstring {
    const char* value;
    int width;

    padstring() { }

    padstring(const char* value, int width) {
      this->value = value;
      this->width = width;
    }
  };

  stringbuf& operator <<(stringbuf& os, const padstring& s);

  //
  // Growable array of plain objects
  //
  template <class T>
  class dynarray {
  public:
    T* data;
    int length;
    int reserved;
    int granularity;

  public:
    inline T& operator [](int i) { return data[i]; }
    inline const T& operator [](int i) const { return data[i]; }

    // NOTE: g *must* be a power of two!
    dynarray() {
      length = reserved = 0;
      granularity = 16;
      data = null;
    }

    dynarray(int initcap, int g = 16) {
      length = 0;
      reserved = 0;
      granularity = g;
      data = null;
      reserve(initcap);
    }

    dynarray(const dynarray<T>& a) {
      length = reserved = 0;
      granularity = a.granularity;
      data = null;
      *this = a;
    }

    ~dynarray() {
      delete[] data;
      data = null;
      length = 0;
      reserved = 0;
    }

    dynarray<T>& operator =(const dynarray<T>& a) {
      if unlikely (&a == this) return *this;
      resize(a.length);
      foreach (i, a.length) data[i] = a.data[i];
      return *this;
    }

    inline int capacity() const { return reserved; }
    inline bool empty() const { return (length == 0); }
    inline void clear() { resize(0); }
    inline int size() const { return length; }
    inline int count() const { return length; }

    void push(const T& obj) {
      T& pushed = push();
      pushed = obj;
    }

    T& push() {
      reserve(length + 1);
      length++;
      return data[length-1];
    }

    T& pop() {
      length--;
      return data[length];
    }

    void resize(int newsize) {
      if likely (newsize > length) reserve(newsize);
      length = newsize;
    }

    void reserve(int newsize) {
      if unlikely (newsize <= reserved) return;
      newsize = (newsize + (granularity-1)) & ~(granularity-1);
      T* newdata = new T[newsize];
      foreach (i, length) newdata[i] = data[i];
      delete[] data;
      data = newdata;
      reserved = newsize;
    }
  };

  //
  // Fixed size bit vector
  //
#define BITVEC_WORDS(n) (((n) + 63) / 64)

  template <size_t N>
  class bitvec {
  protected:
    static const int WORDS = BITVEC_WORDS(N);
    W64 w[WORDS];

    static int wordof(size_t index) { return index / 64; }
    static W64 maskof(size_t index) { return 1ULL << (index % 64); }

    bitvec<N>& sanitize() {
      if (N % 64) w[WORDS-1] &= bitmask64(N % 64);
      return *this;
    }

  public:
    class reference {
      friend class bitvec;

      W64* wp;
      W64 mask;

    public:
      reference(bitvec& b, size_t index) {
        wp = &b.w[wordof(index)];
        mask = maskof(index);
      }

      // For b[i] = x;
      reference& operator =(bool x) {
        *wp = (x) ? (*wp | mask) : (*wp & ~mask);
        return *this;
      }

      // For b[i] = b[j];
      reference& operator =(const reference& j) {
        return (*this = (bool)j);
      }

      bool operator ~() const { return ((*wp & mask) == 0); }

      operator bool() const { return ((*wp & mask) != 0); }
    };

    friend class reference;

    bitvec() { reset(); }

    bitvec(W64 val) {
      reset();
      w[0] = val;
      sanitize();
    }

    bitvec<N>& reset() {
      foreach (i, WORDS) w[i] = 0;
      return *this;
    }

    bitvec<N>& setall() {
      foreach (i, WORDS) w[i] = (W64)(-1LL);
      return sanitize();
    }

    bitvec<N>& set(size_t index) {
      w[wordof(index)] |= maskof(index);
      return *this;
    }

    bitvec<N>& reset(size_t index) {
      w[wordof(index)] &= ~maskof(index);
      return *this;
    }

    bitvec<N>& assign(size_t index, bool val) {
      return (val) ? set(index) : reset(index);
    }

    bool test(size_t index) const {
      return ((w[wordof(index)] & maskof(index)) != 0);
    }

    reference operator [](size_t index) { return reference(*this, index); }

    bool operator [](size_t index) const { return test(index); }

    bitvec<N>& operator &=(const bitvec<N>& rhs) {
      foreach (i, WORDS) w[i] &= rhs.w[i];
      return *this;
    }

    bitvec<N>& operator |=(const bitvec<N>& rhs) {
      foreach (i, WORDS) w[i] |= rhs.w[i];
      return *this;
    }

    bitvec<N>& operator ^=(const bitvec<N>& rhs) {
      foreach (i, WORDS) w[i] ^= rhs.w[i];
      return *this;
    }

    bitvec<N> operator ~() const {
      bitvec<N> b(*this);
      foreach (i, WORDS) b.w[i] = ~b.w[i];
      return b.sanitize();
    }

    bitvec<N> operator &(const bitvec<N>& y) const { return bitvec<N>(*this) &= y; }
    bitvec<N> operator |(const bitvec<N>& y) const { return bitvec<N>(*this) |= y; }
    bitvec<N> operator ^(const bitvec<N>& y) const { return bitvec<N>(*this) ^= y; }

    bool operator ==(const bitvec<N>& rhs) const {
      foreach (i, WORDS) if (w[i] != rhs.w[i]) return false;
      return true;
    }

    bool operator !=(const bitvec<N>& rhs) const { return !(*this == rhs); }

    // Returns the number of bits which are set.
    size_t popcount() const {
      size_t n = 0;
      foreach (i, WORDS) n += popcount64(w[i]);
      return n;
    }

    // Returns the total number of bits.
    size_t size() const { return N; }

    bool nonzero() const {
      foreach (i, WORDS) if (w[i]) return true;
      return false;
    }

    bool iszero() const { return !nonzero(); }

    bool operator *() const { return nonzero(); }
    bool operator !() const { return iszero(); }

    int lsb(int notfound = -1) const {
      foreach (i, WORDS) {
        if likely (w[i]) return (i * 64) + lsbindex64(w[i]);
      }
      return notfound;
    }

    int msb(int notfound = -1) const {
      for (int i = WORDS-1; i >= 0; i--) {
        if likely (w[i]) return (i * 64) + msbindex64(w[i]);
      }
      return notfound;
    }

    // Lowest set bit at or above index <from>:
    int lsbfrom(size_t from, int notfound = -1) const {
      if unlikely (from >= N) return notfound;
      int i = wordof(from);
      W64 t = w[i] & ~(maskof(from) - 1);
      for (;;) {
        if (t) return (i * 64) + lsbindex64(t);
        if (++i >= WORDS) break;
        t = w[i];
      }
      return notfound;
    }

    ostream& print(ostream& os) const {
      foreach (i, N) {
        os << ((test(i)) ? '1' : '0');
      }
      return os;
    }

    stringbuf& print(stringbuf& sb) const {
      foreach (i, N) {
        sb << ((test(i)) ? '1' : '0');
      }
      return sb;
    }
  };

  template <size_t N>
  static inline ostream& operator <<(ostream& os, const bitvec<N>& v) {
    return v.print(os);
  }

  template <size_t N>
  static inline stringbuf& operator <<(stringbuf& sb, const bitvec<N>& v) {
    return v.print(sb);
  }
};

#endif // _SUPERSTL_H_
