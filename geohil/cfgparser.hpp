// -*- C++ -*-
#ifndef _GEOHIL_CFGPARSER_HPP_
#define _GEOHIL_CFGPARSER_HPP_

#include "codec.hpp"
#include "debug.hpp"
#include "geohil.hpp"
#include <toml.hpp>

GEOHIL_NAMESPACE_BEGIN

///
/// @brief Configuration file parser
///
/// A configuration file is either json (comments are allowed) or toml and must have a `codec`
/// section, e.g.,
///
///   [codec]
///   precision     = 12
///   bits_per_char = 4
///   boundary      = "strict"
///
class CfgParser
{
protected:
  json root;

  json toml_to_json(const toml::value& toml_data)
  {
    json result;

    if (toml_data.is_table()) {
      for (const auto& [key, value] : toml_data.as_table()) {
        result[key] = toml_to_json(value);
      }
    } else if (toml_data.is_array()) {
      for (const auto& elem : toml_data.as_array()) {
        result.push_back(toml_to_json(elem));
      }
    } else if (toml_data.is_boolean()) {
      result = toml_data.as_boolean();
    } else if (toml_data.is_integer()) {
      result = toml_data.as_integer();
    } else if (toml_data.is_floating()) {
      result = toml_data.as_floating();
    } else if (toml_data.is_string()) {
      result = static_cast<std::string>(toml_data.as_string());
    }

    return result;
  }

public:
  json get_root()
  {
    return root;
  }

  json get_codec()
  {
    return root["codec"];
  }

  virtual int get_precision()
  {
    return root["codec"].value("precision", default_precision);
  }

  virtual int get_bits_per_char()
  {
    return root["codec"].value("bits_per_char", default_bits_per_char);
  }

  virtual std::string get_boundary()
  {
    return root["codec"].value("boundary", std::string("clamp"));
  }

  bool parse_file(std::string filename, bool exit_on_error = true)
  {
    namespace fs = std::filesystem;

    fs::path    path(filename);
    std::string ext    = path.extension().string();
    bool        status = true;

    try {
      if (ext == ".json") {
        std::ifstream ifs(filename.c_str());
        if (ifs.good() == false) {
          ERROR << tfm::format("Failed to open file: %s", filename);
          status = false;
        } else {
          root = json::parse(ifs, nullptr, true, true);
        }
      } else if (ext == ".toml") {
        root = toml_to_json(toml::parse(filename));
      } else {
        ERROR << tfm::format("Unknown file extension `%s`", ext);
        status = false;
      }
    } catch (std::exception& e) {
      ERROR << tfm::format("Failed to read `%s`: %s", filename, e.what());
      status = false;
    }

    status = status && validate(root);

    if (status == false && exit_on_error == true) {
      ERROR << tfm::format("Failed to parse `%s`", filename);
      exit(1);
    }

    return status;
  }

  void overwrite(json& object)
  {
    if (validate(object) == false) {
      throw_error<InvalidArgument>(tfm::format("Invalid configuration: %s", object.dump()));
    }

    root = object;
  }

  virtual bool validate(json& object)
  {
    bool status = true;

    status = status & check_mandatory_sections(object);

    if (status == true) {
      status = status & check_codec(object["codec"]);
    }

    return status;
  }

  virtual bool check_mandatory_sections(json& object)
  {
    bool status = true;

    std::vector<std::string> mandatory_sections = {"codec"};

    if (object.is_object() == false) {
      ERROR << tfm::format("Configuration must be an object");
      return false;
    }

    for (auto section : mandatory_sections) {
      if (object.contains(section) == false || object[section].is_null()) {
        ERROR << tfm::format("Configuration misses `%s` section", section);
        status = false;
      }
    }

    return status;
  }

  virtual bool check_codec(json& codec)
  {
    try {
      Codec::validate(codec);
    } catch (std::exception& e) {
      ERROR << tfm::format("Invalid `codec` section: %s", e.what());
      return false;
    }

    return true;
  }
};

GEOHIL_NAMESPACE_END

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
#endif
