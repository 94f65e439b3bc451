// file      : mkinst/document.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mkinst/document.hxx>

#include <mkinst/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace mkinst
{
  const permissions document_permissions (permissions::ru | permissions::wu);

  const permissions script_permissions (permissions::ru |
                                        permissions::wu |
                                        permissions::xu);

  // xml_node
  //
  static const string&
  xml_name (const string& n)
  {
    auto start = [] (char c) {return alpha (c) || c == '_' || c == ':';};
    auto other = [&start] (char c)
    {
      return start (c) || digit (c) || c == '-' || c == '.';
    };

    if (n.empty () ||
        !start (n[0]) ||
        find_if_not (n.begin () + 1, n.end (), other) != n.end ())
      throw invalid_argument ("invalid XML name '" + n + "'");

    return n;
  }

  string
  xml_escape (const string& s, bool attr)
  {
    string r;
    r.reserve (s.size ());

    for (char c: s)
    {
      switch (c)
      {
      case '&': r += "&amp;"; break;
      case '<': r += "&lt;";  break;
      case '>': r += "&gt;";  break;
      case '"':
        {
          if (attr)
            r += "&quot;";
          else
            r += c;
          break;
        }
      default:
        r += c;
      }
    }

    return r;
  }

  xml_node xml_node::
  element (string n, string t)
  {
    return xml_node (kind_type::element, move (n), move (t));
  }

  xml_node xml_node::
  comment (string t)
  {
    return xml_node (kind_type::comment, string (), move (t));
  }

  xml_node xml_node::
  instruction (string n, string t)
  {
    return xml_node (kind_type::instruction, move (n), move (t));
  }

  xml_node xml_node::
  blank ()
  {
    return xml_node (kind_type::blank, string (), string ());
  }

  xml_node& xml_node::
  attribute (string n, string v)
  {
    attributes_.emplace_back (move (n), move (v));
    return *this;
  }

  xml_node& xml_node::
  add (xml_node n)
  {
    children_.push_back (move (n));
    return *this;
  }

  void xml_node::
  render (string& r, size_t level, size_t indent) const
  {
    if (kind_ == kind_type::blank)
    {
      r += '\n';
      return;
    }

    r.append (level * indent, ' ');

    switch (kind_)
    {
    case kind_type::comment:
      {
        if (text_.find ("--") != string::npos ||
            (!text_.empty () && text_.back () == '-'))
          throw invalid_argument ("invalid XML comment '" + text_ + "'");

        r += "<!-- ";
        r += text_;
        r += " -->";
        break;
      }
    case kind_type::instruction:
      {
        if (text_.find ("?>") != string::npos)
          throw invalid_argument ("invalid XML processing instruction '" +
                                  text_ + "'");

        r += "<?";
        r += xml_name (name_);
        r += ' ';
        r += text_;
        r += " ?>";
        break;
      }
    case kind_type::element:
      {
        if (!text_.empty () && !children_.empty ())
          throw invalid_argument ("XML element " + name_ +
                                  " has both text and children");

        r += '<';
        r += xml_name (name_);

        for (const auto& a: attributes_)
        {
          r += ' ';
          r += xml_name (a.first);
          r += "=\"";
          r += xml_escape (a.second, true /* attribute */);
          r += '"';
        }

        if (!text_.empty ())
        {
          r += '>';
          r += xml_escape (text_, false /* attribute */);
          r += "</";
          r += name_;
          r += '>';
        }
        else if (!children_.empty ())
        {
          r += ">\n";

          for (const xml_node& c: children_)
            c.render (r, level + 1, indent);

          r.append (level * indent, ' ');
          r += "</";
          r += name_;
          r += '>';
        }
        else
          r += "/>";

        break;
      }
    case kind_type::blank:
      break;
    }

    r += '\n';
  }

  // xml_document
  //
  string xml_document::
  render () const
  {
    if (root.kind () != xml_node::kind_type::element)
      throw invalid_argument ("XML document root must be an element");

    string r ("<?xml");

    for (const auto& a: declaration)
    {
      r += ' ';
      r += xml_name (a.first);
      r += "=\"";
      r += xml_escape (a.second, true /* attribute */);
      r += '"';
    }

    r += "?>\n";

    root.render (r, 0, indent);
    return r;
  }

  // control_document
  //
  control_document& control_document::
  field (string n, string v, bool ml)
  {
    fields_.emplace_back (move (n), move (v));
    multiline_.push_back (ml);
    return *this;
  }

  string control_document::
  render () const
  {
    string r;

    for (size_t i (0); i != fields_.size (); ++i)
    {
      const string& n (fields_[i].first);
      const string& v (fields_[i].second);

      if (n.empty () ||
          n[0] == '#' || n[0] == '-' ||
          find_if (n.begin (), n.end (),
                   [] (char c)
                   {
                     return c == ':' || c == ' ' || c == '\t' || c == '\n';
                   }) != n.end ())
        throw invalid_argument ("invalid control field name '" + n + "'");

      if (!multiline_[i])
        single_line (n.c_str (), v);

      r += n;
      r += ':';

      // First line goes on the field line, the rest are continuation lines.
      //
      size_t b (0);
      for (size_t e; b != string::npos; b = (e != string::npos ? e + 1 : e))
      {
        e = v.find ('\n', b);
        string l (v, b, e != string::npos ? e - b : string::npos);

        if (b == 0)
        {
          if (!l.empty ())
          {
            r += ' ';
            r += l;
          }
        }
        else
        {
          r += "\n ";
          r += l.empty () ? string (".") : l;
        }
      }

      r += '\n';
    }

    return r;
  }

  // text_document
  //
  text_document& text_document::
  append (const text_document& d)
  {
    lines_.insert (lines_.end (), d.lines_.begin (), d.lines_.end ());
    return *this;
  }

  text_document& text_document::
  append (const string& s)
  {
    size_t b (0);
    for (size_t e; b < s.size (); b = e + 1)
    {
      e = s.find ('\n', b);

      if (e == string::npos)
        e = s.size ();

      lines_.push_back (string (s, b, e - b));
    }

    return *this;
  }

  string text_document::
  render () const
  {
    string r;

    for (const string& l: lines_)
    {
      r += l;
      r += '\n';
    }

    return r;
  }

  const string&
  single_line (const char* what, const string& v)
  {
    if (v.find_first_of ("\r\n") != string::npos)
      throw invalid_argument (string (what) + " value contains line break");

    return v;
  }

  void
  write_file (const path& f, const string& s, permissions ps)
  {
    if (verb >= 3)
      text << "write " << f;

    try
    {
      ofdstream os (fdopen (f,
                            fdopen_mode::out    |
                            fdopen_mode::create |
                            fdopen_mode::truncate,
                            ps));

      // The permissions are only applied (and masked with umask) if the file
      // is created, so set them explicitly.
      //
      path_permissions (f, ps);

      os << s;
      os.close ();
    }
    catch (const io_error& e)
    {
      throw document_generation_error (f, e.what ());
    }
    catch (const system_error& e)
    {
      throw document_generation_error (f, e.what ());
    }
  }

  string
  read_file (const path& f)
  {
    try
    {
      ifdstream is (f);
      string r (is.read_text ());
      is.close ();
      return r;
    }
    catch (const io_error& e)
    {
      throw document_generation_error (f, e.what ());
    }
  }
}
