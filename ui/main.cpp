// Application entry point: parse the command line, connect one session and show the transfer window.
#include <QApplication>
#include <QCommandLineParser>
#include <QDesktopServices>
#include <QMessageBox>
#include <QUrl>
#include "BridgeEngine.hpp"
#include "BridgeSettings.hpp"
#include "SecretStore.hpp"
#include "ShadowStore.hpp"
#include "SiteStore.hpp"
#include "TransferQueueDialog.hpp"
#include "remotebridge/Log.hpp"
#include "remotebridge/MockSftpClient.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName("RemoteBridge");
    QCoreApplication::setOrganizationName("RemoteBridge");

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Remote file bridge and transfer queue"));
    parser.addHelpOption();
    QCommandLineOption siteOpt("site", QCoreApplication::translate("main", "Saved site to connect to."), "name");
    QCommandLineOption hostOpt("host", QCoreApplication::translate("main", "Host to connect to."), "host");
    QCommandLineOption portOpt("port", QCoreApplication::translate("main", "SSH port."), "port", "22");
    QCommandLineOption userOpt("user", QCoreApplication::translate("main", "User name."), "user");
    QCommandLineOption keyOpt("key", QCoreApplication::translate("main", "Private key file."), "path");
    QCommandLineOption dirOpt("remote-dir", QCoreApplication::translate("main", "Initial remote directory."), "path");
    QCommandLineOption editOpt("edit", QCoreApplication::translate("main", "Remote file to open for editing."), "path");
    QCommandLineOption mockOpt("mock", QCoreApplication::translate("main", "Use a simulated server."));
    parser.addOptions({ siteOpt, hostOpt, portOpt, userOpt, keyOpt, dirOpt, editOpt, mockOpt });
    parser.process(app);

    remotebridge::SessionParams params;
    SiteStore sites;
    sites.load();
    if (parser.isSet(siteOpt)) {
        auto site = sites.find(parser.value(siteOpt));
        if (!site) {
            QMessageBox::critical(nullptr, "RemoteBridge",
                                  QCoreApplication::translate("main", "Unknown site: %1").arg(parser.value(siteOpt)));
            return 1;
        }
        params = *site;
    } else {
        params.host = parser.value(hostOpt).toStdString();
        params.port = (std::uint16_t)parser.value(portOpt).toUInt();
        params.username = parser.value(userOpt).toStdString();
        if (parser.isSet(keyOpt)) {
            params.auth = remotebridge::AuthMethod::PrivateKey;
            params.private_key_path = parser.value(keyOpt).toStdString();
        }
        params.id = params.username + "@" + params.host;
    }
    if (parser.isSet(mockOpt)) {
        if (params.host.empty()) params.host = "mock";
        if (params.username.empty()) params.username = "demo";
        if (params.id.empty() || params.id == "@") params.id = params.username + "@" + params.host;
    }
    if (params.host.empty() || params.username.empty()) {
        parser.showHelp(2);
    }

    BridgeEngine engine(BridgeSettings::load());
    SecretStore secrets;
    engine.setCredentialProvider(&secrets);
    if (parser.isSet(mockOpt)) {
        auto fs = remotebridge::MockRemoteFs::demo();
        engine.setClientFactory([fs]() { return std::make_unique<remotebridge::MockSftpClient>(fs); });
    }
    engine.setHostKeyConfirm([](const std::string& host, std::uint16_t port, const std::string& alg,
                                const std::string& fp) {
        const QString text = QCoreApplication::translate("main", "Unknown host %1:%2\n%3 %4\n\nTrust this key?")
                                 .arg(QString::fromStdString(host)).arg(port)
                                 .arg(QString::fromStdString(alg), QString::fromStdString(fp));
        return QMessageBox::question(nullptr, "RemoteBridge", text) == QMessageBox::Yes;
    });

    remotebridge::Error err;
    if (!engine.connectSession(params, err)) {
        LOGE("Connect failed: %s", err.describe().c_str());
        QMessageBox::critical(nullptr, "RemoteBridge",
                              QCoreApplication::translate("main", "Could not connect: %1")
                                  .arg(QString::fromStdString(err.describe())));
        return 1;
    }
    const QString sid = QString::fromStdString(params.id);
    if (parser.isSet(dirOpt) && !engine.changeDirectory(sid, parser.value(dirOpt), err)) {
        QMessageBox::warning(nullptr, "RemoteBridge", QString::fromStdString(err.describe()));
    }

    if (parser.isSet(editOpt)) {
        QString local;
        const auto* res = engine.resolver(sid);
        const QString remote = res ? QString::fromStdString(res->resolve(parser.value(editOpt).toStdString()))
                                   : parser.value(editOpt);
        if (engine.shadows()->openForEdit(sid, remote, local, err)) {
            QDesktopServices::openUrl(QUrl::fromLocalFile(local));
        } else {
            QMessageBox::warning(nullptr, "RemoteBridge", QString::fromStdString(err.describe()));
        }
    }

    QObject::connect(engine.shadows(), &ShadowStore::conflictDetected, [](const QString& local, const QString& remote) {
        QMessageBox::warning(nullptr, "RemoteBridge",
                             QCoreApplication::translate("main", "%1 changed on the server while %2 was being edited.")
                                 .arg(remote, local));
    });

    TransferQueueDialog dlg(&engine, sid);
    dlg.show();
    const int rc = app.exec();
    engine.shutdown();
    return rc;
}
