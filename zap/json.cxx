// file      : zap/json.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/json.hxx>

#include <cstdlib> // strtoull(), strtod()

using namespace std;

namespace zap
{
  using event = json::event;

  optional<string>
  next_json_string (json::parser& p)
  {
    optional<event> e (p.peek ());

    if (e && (*e == event::string || *e == event::number))
    {
      p.next ();
      return move (p.value ());
    }

    p.next_expect_value_skip ();
    return nullopt;
  }

  optional<uint64_t>
  next_json_uint (json::parser& p)
  {
    optional<event> e (p.peek ());

    if (e && *e == event::number)
    {
      p.next ();

      const string& v (p.value ());

      if (!v.empty () && digit (v[0]))
      {
        char* end (nullptr);
        uint64_t r (strtoull (v.c_str (), &end, 10));

        if (*end == '\0')
          return r;
      }

      return nullopt;
    }

    p.next_expect_value_skip ();
    return nullopt;
  }

  optional<double>
  next_json_double (json::parser& p)
  {
    optional<event> e (p.peek ());

    if (e && *e == event::number)
    {
      p.next ();

      const string& v (p.value ());

      char* end (nullptr);
      double r (strtod (v.c_str (), &end));

      if (end != v.c_str () && *end == '\0')
        return r;

      return nullopt;
    }

    p.next_expect_value_skip ();
    return nullopt;
  }

  strings
  next_json_strings (json::parser& p)
  {
    strings r;

    optional<event> e (p.peek ());

    if (!e || *e != event::begin_array)
    {
      p.next_expect_value_skip ();
      return r;
    }

    p.next (); // begin_array

    for (; (e = p.peek ()) && *e != event::end_array; )
    {
      if (*e == event::string)
      {
        p.next ();
        r.push_back (move (p.value ()));
      }
      else
        p.next_expect_value_skip ();
    }

    p.next_expect (event::end_array);
    return r;
  }
}
