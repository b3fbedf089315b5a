#ifndef __MW_FILTER_NODE__
#define __MW_FILTER_NODE__

#include "ClientState.hpp"
#include "Headers.hpp"
#include "PushEvent.hpp"

namespace mw {
class FilterNode;
typedef shared_ptr<const FilterNode> FilterPtr;

/**
 * @brief Immutable predicate tree over (client state, push event) pairs.
 *
 * Leaves inspect one field of the event; AND/OR/NOT combine other nodes.
 * Nodes are shared, so one filter can be reused by many handler bindings.
 */
class FilterNode {
 public:
  enum class Kind {
    TEXT,
    COMMAND,
    USER_ID,
    ME,
    MESSAGE_TYPE,
    USER,
    EVENT_OPCODE,
    ANY,
    CUSTOM,
    AND,
    OR,
    NOT,
  };

  typedef std::function<bool(const ClientState&, const PushEvent&)> Predicate;

  /** @brief Message text equals `text`, ignoring ASCII case. */
  static FilterPtr text(const string& text);
  /** @brief Message text starts with `prefix + command`, ignoring case. */
  static FilterPtr command(const string& command, const string& prefix = "/");
  /** @brief Message was sent by the given user id. */
  static FilterPtr userId(int64_t userId);
  /**
   * @brief Message was sent by the logged in account.  Evaluating it before
   * login throws UnauthenticatedError.
   */
  static FilterPtr me();
  /** @brief Message has the given type, e.g. "USER". */
  static FilterPtr messageType(const string& type);
  /**
   * @brief Message is an ordinary user message.  Like me(), it throws
   * UnauthenticatedError before login.
   */
  static FilterPtr user();
  /** @brief Push event carries the given opcode. */
  static FilterPtr eventOpcode(int opcode);
  /** @brief Accepts every event. */
  static FilterPtr any();
  /** @brief Wraps an arbitrary callable. */
  static FilterPtr custom(Predicate predicate);

  static FilterPtr allOf(const vector<FilterPtr>& nodes);
  static FilterPtr anyOf(const vector<FilterPtr>& nodes);
  static FilterPtr negate(FilterPtr node);

  /**
   * @brief Evaluates the tree.  AND stops at the first false child and OR at
   * the first true one.
   * @throws UnauthenticatedError from a `me()` or `user()` leaf that is
   * reached before login.
   */
  bool evaluate(const ClientState& state, const PushEvent& event) const;

  Kind getKind() const { return kind; }
  const vector<FilterPtr>& getChildren() const { return children; }

 protected:
  explicit FilterNode(Kind _kind) : kind(_kind), intArg(0) {}

  bool evaluateLeaf(const ClientState& state, const PushEvent& event) const;

  Kind kind;
  /** @brief Lowercased text, command (with prefix) or message type. */
  string textArg;
  /** @brief User id or opcode. */
  int64_t intArg;
  Predicate predicate;
  vector<FilterPtr> children;
};

string filterKindToString(FilterNode::Kind kind);
}  // namespace mw

#endif  // __MW_FILTER_NODE__
