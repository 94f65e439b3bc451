// file      : mkinst/document.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MKINST_DOCUMENT_HXX
#define MKINST_DOCUMENT_HXX

#include <mkinst/types.hxx>
#include <mkinst/utility.hxx>

#include <mkinst/errors.hxx>

namespace mkinst
{
  // Metadata documents.
  //
  // A document is built in memory and then rendered to its serialized form.
  // Rendering is a pure function of the content (no timestamps, host names,
  // etc) and throws invalid_argument if the content cannot be represented
  // (for example, an invalid XML name).
  //

  // XML node: element, comment, processing instruction, or blank line.
  //
  // Note that child references returned by the accessors are invalidated by
  // adding further children to the same parent.
  //
  class xml_node
  {
  public:
    enum class kind_type {element, comment, instruction, blank};

    static xml_node
    element (string name, string text = string ());

    static xml_node
    comment (string text);

    // Rendered as <?target data ?>.
    //
    static xml_node
    instruction (string target, string data);

    static xml_node
    blank ();

    // Add the attribute (rendered in the order added) returning this node.
    //
    xml_node&
    attribute (string name, string value);

    // Add the child node returning this node.
    //
    xml_node&
    add (xml_node);

    kind_type
    kind () const {return kind_;}

    const string&
    name () const {return name_;}

    const string&
    text () const {return text_;}

    const vector<pair<string, string>>&
    attributes () const {return attributes_;}

    const vector<xml_node>&
    children () const {return children_;}

    // Serialize the node at the specified nesting level.
    //
    void
    render (string&, size_t level, size_t indent) const;

  private:
    xml_node (kind_type k, string n, string t)
        : kind_ (k), name_ (move (n)), text_ (move (t)) {}

    kind_type kind_;
    string name_;  // Element name or instruction target.
    string text_;  // Element text, comment text, or instruction data.
    vector<pair<string, string>> attributes_;
    vector<xml_node> children_;
  };

  class xml_document
  {
  public:
    // The XML declaration attributes, for example, {{"version", "1.0"},
    // {"encoding", "utf-8"}}.
    //
    explicit
    xml_document (xml_node root,
                  vector<pair<string, string>> declaration =
                    {{"version", "1.0"}},
                  size_t indent = 4)
        : root (move (root)),
          declaration (move (declaration)),
          indent (indent) {}

    xml_node root;
    vector<pair<string, string>> declaration;
    size_t indent;

    string
    render () const;
  };

  // Escape the XML character data or attribute value.
  //
  string
  xml_escape (const string&, bool attribute);

  // Control file (Debian control, RPM header, etc): ordered `Name: value`
  // fields. A multi-line value is rendered with continuation lines indented
  // with a space and empty lines replaced with ` .`.
  //
  class control_document
  {
  public:
    control_document&
    field (string name, string value, bool multiline = false);

    const vector<pair<string, string>>&
    fields () const {return fields_;}

    string
    render () const;

  private:
    vector<pair<string, string>> fields_;
    vector<bool> multiline_;
  };

  // Plain text document (scripts, spec files, etc) as a list of lines.
  //
  class text_document
  {
  public:
    text_document&
    line (string l = string ())
    {
      lines_.push_back (move (l));
      return *this;
    }

    // Append the contents of another document or a multi-line string.
    //
    text_document&
    append (const text_document&);

    text_document&
    append (const string&);

    const strings&
    lines () const {return lines_;}

    bool
    empty () const {return lines_.empty ();}

    string
    render () const;

  private:
    strings lines_;
  };

  // Return the value unchanged if it doesn't contain line breaks and throw
  // invalid_argument otherwise.
  //
  const string&
  single_line (const char* what, const string& value);

  // Owner-only document permissions.
  //
  extern const permissions document_permissions; // rw-------
  extern const permissions script_permissions;   // rwx------

  // Write the rendered document to the file, creating or truncating it.
  // The permissions are set even if the file already exists. Throw
  // document_generation_error if the document cannot be rendered or
  // written.
  //
  void
  write_file (const path&, const string& content, permissions);

  template <typename D>
  void
  write_document (const path& f,
                  const D& d,
                  permissions ps = document_permissions)
  {
    string s;
    try
    {
      s = d.render ();
    }
    catch (const invalid_argument& e)
    {
      throw document_generation_error (f, e.what ());
    }

    write_file (f, s, ps);
  }

  // Read the file into a string. Throw document_generation_error on
  // failure.
  //
  string
  read_file (const path&);
}

#endif // MKINST_DOCUMENT_HXX
