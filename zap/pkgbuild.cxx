// file      : zap/pkgbuild.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <zap/pkgbuild.hxx>

#include <zap/package.hxx>
#include <zap/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace zap
{
  enum class pkgbuild_state
  {
    idle,               // Outside declarations, at the beginning of a line
                        // or after a complete declaration.
    scalar_assignment,  // After <name>= not followed by '('.
    array_open,         // After <name>=( on the declaration line.
    array_continuation, // On the subsequent lines of an open array.
    in_quoted_token     // Inside '...' or "...".
  };

  static bool
  dependency_key (const string& n)
  {
    for (const string k: {"depends", "makedepends", "checkdepends"})
    {
      size_t kn (k.size ());

      if (n.compare (0, kn, k) == 0 &&
          (n.size () == kn || (n[kn] == '_' && n.size () > kn + 1)))
        return true;
    }

    return false;
  }

  static inline bool
  space (char c)
  {
    return c == ' ' || c == '\t' || c == '\r';
  }

  strings
  parse_pkgbuild_depends (const string& t)
  {
    tracer trace ("parse_pkgbuild_depends");

    using state = pkgbuild_state;

    strings r;

    size_t n (t.size ());

    state  s  (state::idle);
    state  rs (state::idle); // State to return to after the quoted token.
    char   q  ('\0');        // Quote character of the current quoted token.
    string tk;               // Current token.
    bool   tks (false);      // True if the current token is started.

    auto add = [&r, &tk, &tks] ()
    {
      if (tks)
      {
        string d (clean_dependency_name (tk));

        if (!d.empty ())
          r.push_back (move (d));

        tk.clear ();
        tks = false;
      }
    };

    for (size_t i (0); i != n; )
    {
      switch (s)
      {
      case state::idle:
        {
          size_t e (t.find ('\n', i));
          if (e == string::npos)
            e = n;

          // Several declarations can be separated with ';' on one line.
          //
          size_t b (i);
          for (; b != e && (space (t[b]) || t[b] == ';'); ++b) ;

          // Note that the blank and comment lines end up with an empty name.
          //
          size_t p (b);
          for (; p != e && (alnum (t[p]) || t[p] == '_'); ++p) ;

          if (p != b && dependency_key (string (t, b, p - b)))
          {
            if (p != e && t[p] == '+')
              ++p;

            if (p != e && t[p] == '=')
            {
              ++p;

              if (p != e && t[p] == '(')
              {
                s = state::array_open;
                i = p + 1;
              }
              else
              {
                s = state::scalar_assignment;
                i = p;
              }

              break;
            }
          }

          i = e != n ? e + 1 : n;
          break;
        }
      case state::scalar_assignment:
      case state::array_open:
      case state::array_continuation:
        {
          bool a (s != state::scalar_assignment);
          char c (t[i]);

          if (c == '\n')
          {
            add ();
            s = a ? state::array_continuation : state::idle;
            ++i;
          }
          else if (space (c))
          {
            add ();

            // The scalar value ends at the first unquoted whitespace.
            //
            if (!a)
              s = state::idle;

            ++i;
          }
          else if (c == ';' && !a)
          {
            add ();
            s = state::idle;
            ++i;
          }
          else if (c == '\\')
          {
            // Note that the escaped newline is a line continuation.
            //
            if (i + 1 != n && t[i + 1] != '\n')
            {
              tk += t[i + 1];
              tks = true;
            }

            i = i + 1 != n ? i + 2 : n;
          }
          else if (c == '\'' || c == '"')
          {
            q = c;
            rs = s;
            tks = true; // Empty quoted token is still a token.
            s = state::in_quoted_token;
            ++i;
          }
          else if (c == '#' && !tks)
          {
            // Comment. Leave the newline for the above.
            //
            i = t.find ('\n', i);
            if (i == string::npos)
              i = n;

            if (!a)
              s = state::idle;
          }
          else if (c == ')' && a)
          {
            add ();
            s = state::idle;
            ++i;
          }
          else
          {
            tk += c;
            tks = true;
            ++i;
          }

          break;
        }
      case state::in_quoted_token:
        {
          char c (t[i]);

          if (c == q)
          {
            s = rs;
            ++i;
          }
          else if (c == '\\' && q == '"' && i + 1 != n)
          {
            tk += t[i + 1];
            i += 2;
          }
          else
          {
            tk += c;
            ++i;
          }

          break;
        }
      }
    }

    if (s == state::in_quoted_token)
      l4 ([&]{trace << "dropping unterminated quoted token '" << tk << "'";});
    else
      add ();

    return r;
  }

  strings
  read_pkgbuild_depends (const path& f)
  {
    if (!exists (f, true /* ignore_error */))
      return strings ();

    string t;
    try
    {
      ifdstream is (f);
      t = is.read_text ();
      is.close ();
    }
    catch (const io_error& e)
    {
      throw package_error (package_error_kind::parse,
                           "unable to read from " + f.string () + ": " +
                           e.what ());
    }

    return parse_pkgbuild_depends (t);
  }

  string
  clean_dependency_name (const string& d)
  {
    string r (d);
    trim (r);

    // Only consider the first word.
    //
    size_t p (r.find_first_of (" \t\r\n"));
    if (p != string::npos)
      r.resize (p);

    // Strip the version constraint (>=, <=, =, <, >).
    //
    p = r.find_first_of ("<>=");
    if (p != string::npos)
      r.resize (p);

    if (r.find_first_not_of ("()") == string::npos)
      r.clear ();

    return r;
  }
}
