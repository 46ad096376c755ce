#pragma once
/*
 * Clipboard
 *
 * Purpose: transport for copied text. The core only produces/consumes plain
 *          text; where that text lives is the transport's business.
 * Note: RegisterClipboard keeps it in-process, like an editor register.
 */
#include <optional>
#include <string>

class IClipboard {
public:
  virtual ~IClipboard() = default;
  virtual bool set_text(const std::string& text) = 0;
  virtual std::optional<std::string> get_text() const = 0;
};

class RegisterClipboard : public IClipboard {
public:
  bool set_text(const std::string& text) override { text_ = text; return true; }
  std::optional<std::string> get_text() const override { return text_; }
private:
  std::optional<std::string> text_;
};
