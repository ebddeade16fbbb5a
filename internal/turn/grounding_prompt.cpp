#include "grounding_prompt.hpp"

#include <iterator>
#include <sstream>

namespace ragturn::turn {

namespace {

std::string HeadingPath(const retrieval::Passage& passage) {
  if (passage.heading_path.empty()) return passage.title;

  std::string path;
  for (const auto& heading : passage.heading_path) {
    if (!path.empty()) path += " > ";
    path += heading;
  }
  return path;
}

} // namespace

std::string BuildGroundingPrompt(const std::vector<retrieval::RetrievalResult>& results) {
  std::ostringstream context;
  for (std::size_t i = 0; i < results.size(); ++i) {
    const auto& passage = *results[i].passage;
    if (i > 0) context << "\n\n";
    context << "[" << (i + 1) << "]\n"
            << "Title: " << passage.title << "\n"
            << "URL: " << passage.url << "\n"
            << "Section: " << passage.section.value_or("(not provided)") << "\n"
            << "Heading path: " << HeadingPath(passage) << "\n"
            << "Excerpt:\n"
            << passage.text;
  }

  std::ostringstream prompt;
  prompt << "You are a support assistant for support articles.\n"
         << "Answer only using the supplied context excerpts.\n"
         << "If the context is incomplete, say what is missing and suggest the closest supported next step.\n"
         << "Never invent product behavior or policy.\n"
         << "Cite supporting excerpts inline using [1], [2], etc.\n"
         << "End each answer with a short 'Sources' section listing the citation numbers and URLs.\n"
         << "\n"
         << "Support article context:\n"
         << (results.empty() ? std::string("No context found.") : context.str());
  return prompt.str();
}

std::vector<provider::ChatMessage> TrimConversation(std::vector<provider::ChatMessage> messages, std::size_t max_messages) {
  if (messages.size() <= max_messages) return messages;
  return std::vector<provider::ChatMessage>(std::make_move_iterator(messages.end() - static_cast<std::ptrdiff_t>(max_messages)),
                                            std::make_move_iterator(messages.end()));
}

} // namespace ragturn::turn
