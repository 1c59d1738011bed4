#include "app/cli/realm_tree.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace atrium::app {

namespace {

[[nodiscard]] QString render_id_suffix(Key id, bool include_ids) {
    return include_ids ? (QStringLiteral(" (") + QString::number(id) + QStringLiteral(")"))
                       : QString{};
}

[[nodiscard]] QString render_realm_line(const Realm& realm, int depth, bool include_ids) {
    const auto indent = QString(depth * 2, QLatin1Char(' '));
    return indent + QStringLiteral("- ") + QString::fromStdString(realm.name) +
           QStringLiteral(" [") + QString::fromStdString(realm.full_path) + QStringLiteral("]") +
           render_id_suffix(realm.id, include_ids);
}

Result<void> render_subtree(QStringList& out, tree::Query& query, const Realm& parent, int depth,
                            const RealmTreeOptions& options) {
    if (options.max_depth >= 0 && depth > options.max_depth) {
        return Result<void>::ok();
    }
    auto children = query.children(parent.id);
    if (children.is_err()) {
        return Result<void>::err(children.unwrap_err());
    }
    for (const auto& child : children.unwrap()) {
        out.append(render_realm_line(child, depth, options.include_ids));
        auto nested = render_subtree(out, query, child, depth + 1, options);
        if (nested.is_err()) {
            return nested;
        }
    }
    return Result<void>::ok();
}

Result<QJsonObject> realm_to_json(tree::Query& query, const Realm& realm, int depth,
                                  const RealmTreeOptions& options) {
    QJsonObject obj;
    if (options.include_ids) {
        obj.insert(QStringLiteral("id"), static_cast<qint64>(realm.id));
    }
    obj.insert(QStringLiteral("name"), QString::fromStdString(realm.name));
    obj.insert(QStringLiteral("path"), realm.is_root() ? QStringLiteral("/")
                                                       : QString::fromStdString(realm.full_path));
    obj.insert(QStringLiteral("childOrder"),
               QString::fromUtf8(child_order_name(realm.child_order).data()));

    QJsonArray children_json;
    if (options.max_depth < 0 || depth < options.max_depth) {
        auto children = query.children(realm.id);
        if (children.is_err()) {
            return Result<QJsonObject>::err(children.unwrap_err());
        }
        for (const auto& child : children.unwrap()) {
            auto child_json = realm_to_json(query, child, depth + 1, options);
            if (child_json.is_err()) {
                return child_json;
            }
            children_json.append(child_json.unwrap());
        }
    }
    obj.insert(QStringLiteral("children"), children_json);
    return Result<QJsonObject>::ok(obj);
}

Result<Realm> load_root(tree::Query& query) {
    auto root = query.realm_by_id(ROOT_REALM_ID);
    if (root.is_err()) {
        return Result<Realm>::err(root.unwrap_err());
    }
    if (!root.unwrap()) {
        return Result<Realm>::err(Error::not_found("Root realm is missing"));
    }
    return Result<Realm>::ok(*root.unwrap());
}

} // namespace

Result<QString> format_realm_tree(tree::Query& query, const RealmTreeOptions& options) {
    auto root = load_root(query);
    if (root.is_err()) {
        return Result<QString>::err(root.unwrap_err());
    }

    QStringList lines;
    const auto root_name = root.unwrap().name.empty()
        ? QStringLiteral("(Root)")
        : QStringLiteral("(") + QString::fromStdString(root.unwrap().name) + QStringLiteral(")");
    lines.append(QStringLiteral("/ ") + root_name + render_id_suffix(ROOT_REALM_ID, options.include_ids));

    auto rendered = render_subtree(lines, query, root.unwrap(), 1, options);
    if (rendered.is_err()) {
        return Result<QString>::err(rendered.unwrap_err());
    }
    return Result<QString>::ok(lines.join(QLatin1Char('\n')) + QLatin1Char('\n'));
}

Result<QString> format_realm_tree_json(tree::Query& query, const RealmTreeOptions& options) {
    auto root = load_root(query);
    if (root.is_err()) {
        return Result<QString>::err(root.unwrap_err());
    }
    auto json = realm_to_json(query, root.unwrap(), 0, options);
    if (json.is_err()) {
        return Result<QString>::err(json.unwrap_err());
    }
    return Result<QString>::ok(
        QString::fromUtf8(QJsonDocument(json.unwrap()).toJson(QJsonDocument::Indented)));
}

} // namespace atrium::app
