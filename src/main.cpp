#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QTextStream>

#include "app/cli/realm_mutations.hpp"
#include "app/cli/realm_tree.hpp"
#include "app/cli/search_output.hpp"
#include "app/config.hpp"
#include "app/logging.hpp"
#include "search/fts_index.hpp"
#include "search/indexer.hpp"
#include "search/searcher.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "sync/http_harvest_client.hpp"
#include "sync/sync_daemon.hpp"
#include "tree/query.hpp"
#include "tree/tree_service.hpp"

#include <atomic>
#include <csignal>

Q_LOGGING_CATEGORY(atriumAppLog, "atrium.app")

namespace {

std::atomic<atrium::sync::SyncDaemon*> g_daemon{nullptr};

void signal_handler(int) {
    if (auto* daemon = g_daemon.load()) {
        daemon->signal_stop();
    }
}

int fail(const atrium::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.describe()) << QLatin1Char('\n');
    return 1;
}

int usage(const QCommandLineParser& parser) {
    QTextStream(stderr) << parser.helpText();
    return 2;
}

atrium::Result<atrium::storage::Database> open_database(const atrium::app::AppConfig& config) {
    auto db = atrium::storage::Database::open(config.database_path.toStdString(),
                                              config.busy_timeout_ms);
    if (db.is_err()) {
        return db;
    }
    auto migrated = atrium::storage::initialize_database(db.unwrap());
    if (migrated.is_err()) {
        return atrium::Result<atrium::storage::Database>::err(migrated.unwrap_err());
    }
    return db;
}

// The command line acts with full rights.
atrium::acl::User operator_user(const atrium::app::AppConfig& config) {
    return atrium::acl::User{std::string("admin"), {config.roles.admin_role}};
}

int run_sync(const atrium::app::AppConfig& config, bool once) {
    if (auto ok = atrium::app::require_harvest_source(config); ok.is_err()) {
        return fail(ok.unwrap_err());
    }
    auto db = open_database(config);
    if (db.is_err()) return fail(db.unwrap_err());
    auto index = atrium::search::FtsIndex::open(config.index_path.toStdString(),
                                                config.busy_timeout_ms);
    if (index.is_err()) return fail(index.unwrap_err());

    atrium::search::Indexer indexer(db.unwrap(), index.unwrap(), config.indexer);
    atrium::sync::HttpHarvestClient source(config.harvest);
    atrium::sync::SyncDaemon daemon(db.unwrap(), source, indexer, config.sync);

    g_daemon.store(&daemon);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    qCInfo(atriumAppLog) << "Syncing from" << config.harvest.base_url.toString();
    auto state = daemon.run(once ? atrium::sync::RunMode::UntilCaughtUp
                                 : atrium::sync::RunMode::Forever);

    g_daemon.store(nullptr);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    if (state.is_err()) return fail(state.unwrap_err());
    if (state.unwrap() == atrium::sync::SyncState::Halted) {
        return fail(*daemon.context().halt_reason);
    }
    if (state.unwrap() == atrium::sync::SyncState::Backoff) {
        QTextStream(stderr) << "Harvest source unavailable, try again later\n";
        return 1;
    }
    return 0;
}

int run_search_index(const atrium::app::AppConfig& config, const QString& action) {
    auto db = open_database(config);
    if (db.is_err()) return fail(db.unwrap_err());
    auto index = atrium::search::FtsIndex::open(config.index_path.toStdString(),
                                                config.busy_timeout_ms);
    if (index.is_err()) return fail(index.unwrap_err());

    atrium::search::Indexer indexer(db.unwrap(), index.unwrap(), config.indexer);
    auto run = action == QStringLiteral("rebuild") ? indexer.rebuild() : indexer.process_queue();
    if (run.is_err()) return fail(run.unwrap_err());

    QTextStream(stdout) << "Indexed " << run.unwrap().upserted << " documents, removed "
                        << run.unwrap().removed << '\n';
    return 0;
}

int run_search(const atrium::app::AppConfig& config, const QString& text, bool json) {
    auto index = atrium::search::FtsIndex::open(config.index_path.toStdString(),
                                                config.busy_timeout_ms);
    if (index.is_err()) return fail(index.unwrap_err());

    atrium::search::Searcher searcher(index.unwrap(), atrium::acl::Resolver(config.roles));
    auto hits = searcher.search(text.toStdString(), operator_user(config));
    if (hits.is_err()) return fail(hits.unwrap_err());

    QTextStream(stdout) << (json ? atrium::app::format_search_hits_json(hits.unwrap())
                                 : atrium::app::format_search_hits(hits.unwrap()));
    return 0;
}

int run_realm(const atrium::app::AppConfig& config, const QStringList& args,
              const QCommandLineParser& parser, bool json, bool include_ids) {
    if (args.size() < 2) return usage(parser);

    auto db = open_database(config);
    if (db.is_err()) return fail(db.unwrap_err());

    const atrium::acl::Resolver resolver(config.roles);
    atrium::tree::Query query(db.unwrap(), resolver);
    atrium::tree::TreeService tree(db.unwrap(), resolver);
    const auto user = operator_user(config);
    const auto& action = args.at(1);

    if (action == QStringLiteral("tree")) {
        const atrium::app::RealmTreeOptions options{.include_ids = include_ids};
        auto output = json ? atrium::app::format_realm_tree_json(query, options)
                           : atrium::app::format_realm_tree(query, options);
        if (output.is_err()) return fail(output.unwrap_err());
        QTextStream(stdout) << output.unwrap();
        return 0;
    }

    if (action == QStringLiteral("add-child")) {
        if (args.size() != 5) return usage(parser);
        auto realm = atrium::app::add_child(query, tree, user,
                                            {.parent_path = args.at(2),
                                             .path_segment = args.at(3),
                                             .name = args.at(4)});
        if (realm.is_err()) return fail(realm.unwrap_err());
        QTextStream(stdout) << "Created " << QString::fromStdString(realm.unwrap().full_path)
                            << " (" << realm.unwrap().id << ")\n";
        return 0;
    }

    if (action == QStringLiteral("delete")) {
        if (args.size() != 3) return usage(parser);
        auto parent = atrium::app::delete_realm(query, tree, user, {.path = args.at(2)});
        if (parent.is_err()) return fail(parent.unwrap_err());
        QTextStream(stdout) << "Deleted " << args.at(2) << '\n';
        return 0;
    }

    return usage(parser);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("atriumd");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Atrium");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Atrium video portal backend\n\n"
        "Commands:\n"
        "  sync [--once]                                   Mirror the harvest feed\n"
        "  search-index rebuild|update                     Maintain the search index\n"
        "  search <text>                                   Query the search index\n"
        "  realm tree                                      Print the realm tree\n"
        "  realm add-child <parent-path> <segment> <name>  Create a realm\n"
        "  realm delete <path>                             Delete a realm subtree"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("config")},
        QStringLiteral("INI configuration file (default: $ATRIUM_CONFIG)."),
        QStringLiteral("path"));
    parser.addOption(configOption);

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets ATRIUM_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption includeIdsOption(
        QStringList{QStringLiteral("ids")},
        QStringLiteral("Include IDs in CLI output."));
    parser.addOption(includeIdsOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption onceOption(
        QStringList{QStringLiteral("once")},
        QStringLiteral("Stop 'sync' once the feed is drained instead of polling."));
    parser.addOption(onceOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync and harvest debug logging."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run (e.g. 'sync')."));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("ATRIUM_DB_PATH", parser.value(dbPathOption).toUtf8());
    }

    const auto configPath = parser.isSet(configOption) ? parser.value(configOption)
                                                       : qEnvironmentVariable("ATRIUM_CONFIG");
    auto config = atrium::app::load_config(configPath);
    if (config.is_err()) {
        return fail(config.unwrap_err());
    }

    atrium::app::install_file_logging(config.unwrap().log_file);
    if (parser.isSet(debugSyncOption)) {
        atrium::app::enable_sync_debug_logging();
        qCInfo(atriumAppLog) << "Sync debug enabled";
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usage(parser);
    }
    const auto& command = positional.first();

    if (command == QStringLiteral("sync")) {
        return run_sync(config.unwrap(), parser.isSet(onceOption));
    }

    if (command == QStringLiteral("search-index")) {
        if (positional.size() != 2 || (positional.at(1) != QStringLiteral("rebuild") &&
                                       positional.at(1) != QStringLiteral("update"))) {
            return usage(parser);
        }
        return run_search_index(config.unwrap(), positional.at(1));
    }

    if (command == QStringLiteral("search")) {
        if (positional.size() < 2) return usage(parser);
        const auto text = positional.mid(1).join(QLatin1Char(' '));
        return run_search(config.unwrap(), text, parser.isSet(jsonOption));
    }

    if (command == QStringLiteral("realm")) {
        return run_realm(config.unwrap(), positional, parser, parser.isSet(jsonOption),
                         parser.isSet(includeIdsOption));
    }

    return usage(parser);
}
