#include "FilterNode.hpp"

#include "Errors.hpp"

namespace mw {
namespace {
void checkChildren(const vector<FilterPtr>& nodes) {
  for (const auto& node : nodes) {
    if (!node) {
      throw std::invalid_argument("Filter combinator given a null node");
    }
  }
}
}  // namespace

FilterPtr FilterNode::text(const string& text) {
  shared_ptr<FilterNode> node(new FilterNode(Kind::TEXT));
  node->textArg = toLowerAscii(text);
  return node;
}

FilterPtr FilterNode::command(const string& command, const string& prefix) {
  shared_ptr<FilterNode> node(new FilterNode(Kind::COMMAND));
  node->textArg = toLowerAscii(prefix + command);
  return node;
}

FilterPtr FilterNode::userId(int64_t userId) {
  shared_ptr<FilterNode> node(new FilterNode(Kind::USER_ID));
  node->intArg = userId;
  return node;
}

FilterPtr FilterNode::me() {
  return shared_ptr<FilterNode>(new FilterNode(Kind::ME));
}

FilterPtr FilterNode::messageType(const string& type) {
  shared_ptr<FilterNode> node(new FilterNode(Kind::MESSAGE_TYPE));
  node->textArg = type;
  return node;
}

FilterPtr FilterNode::user() {
  shared_ptr<FilterNode> node(new FilterNode(Kind::USER));
  node->textArg = "USER";
  return node;
}

FilterPtr FilterNode::eventOpcode(int opcode) {
  shared_ptr<FilterNode> node(new FilterNode(Kind::EVENT_OPCODE));
  node->intArg = opcode;
  return node;
}

FilterPtr FilterNode::any() {
  return shared_ptr<FilterNode>(new FilterNode(Kind::ANY));
}

FilterPtr FilterNode::custom(Predicate predicate) {
  if (!predicate) {
    throw std::invalid_argument("Custom filter needs a callable");
  }
  shared_ptr<FilterNode> node(new FilterNode(Kind::CUSTOM));
  node->predicate = predicate;
  return node;
}

FilterPtr FilterNode::allOf(const vector<FilterPtr>& nodes) {
  checkChildren(nodes);
  shared_ptr<FilterNode> node(new FilterNode(Kind::AND));
  node->children = nodes;
  return node;
}

FilterPtr FilterNode::anyOf(const vector<FilterPtr>& nodes) {
  checkChildren(nodes);
  shared_ptr<FilterNode> node(new FilterNode(Kind::OR));
  node->children = nodes;
  return node;
}

FilterPtr FilterNode::negate(FilterPtr child) {
  checkChildren({child});
  shared_ptr<FilterNode> node(new FilterNode(Kind::NOT));
  node->children.push_back(child);
  return node;
}

bool FilterNode::evaluate(const ClientState& state,
                          const PushEvent& event) const {
  switch (kind) {
    case Kind::AND:
      for (const auto& child : children) {
        if (!child->evaluate(state, event)) {
          return false;
        }
      }
      return true;
    case Kind::OR:
      for (const auto& child : children) {
        if (child->evaluate(state, event)) {
          return true;
        }
      }
      return false;
    case Kind::NOT:
      return !children[0]->evaluate(state, event);
    default:
      return evaluateLeaf(state, event);
  }
}

bool FilterNode::evaluateLeaf(const ClientState& state,
                              const PushEvent& event) const {
  switch (kind) {
    case Kind::ANY:
      return true;
    case Kind::EVENT_OPCODE:
      return event.opcode == intArg;
    case Kind::CUSTOM:
      return predicate(state, event);
    case Kind::ME: {
      // Checked before the message so a missing login is always reported
      int64_t selfId = state.getSelfId();
      return event.message && event.message->sender == selfId;
    }
    case Kind::USER:
      state.getSelfId();
      return event.message && event.message->type == textArg;
    default:
      break;
  }

  if (!event.message) {
    return false;
  }
  const Message& message = *event.message;
  switch (kind) {
    case Kind::TEXT:
      return message.text && toLowerAscii(*message.text) == textArg;
    case Kind::COMMAND:
      return message.text &&
             toLowerAscii(*message.text).compare(0, textArg.size(), textArg) ==
                 0;
    case Kind::USER_ID:
      return message.sender == intArg;
    case Kind::MESSAGE_TYPE:
      return message.type == textArg;
    default:
      STFATAL << "Unexpected filter kind: " << filterKindToString(kind);
  }
  return false;
}

string filterKindToString(FilterNode::Kind kind) {
  switch (kind) {
    case FilterNode::Kind::TEXT:
      return "text";
    case FilterNode::Kind::COMMAND:
      return "command";
    case FilterNode::Kind::USER_ID:
      return "userId";
    case FilterNode::Kind::ME:
      return "me";
    case FilterNode::Kind::MESSAGE_TYPE:
      return "messageType";
    case FilterNode::Kind::USER:
      return "user";
    case FilterNode::Kind::EVENT_OPCODE:
      return "eventOpcode";
    case FilterNode::Kind::ANY:
      return "any";
    case FilterNode::Kind::CUSTOM:
      return "custom";
    case FilterNode::Kind::AND:
      return "and";
    case FilterNode::Kind::OR:
      return "or";
    case FilterNode::Kind::NOT:
      return "not";
  }
  return "unknown";
}
}  // namespace mw
