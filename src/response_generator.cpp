#include "response_generator.hpp"
#include <cctype>

std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// The query lands in prose, so it must not be able to open a fence or add lines.
std::string sanitize_query(const std::string& query) {
  std::string out;
  out.reserve(query.size());
  for (char c : query) {
    if (c == '\n' || c == '\r' || c == '\t') out.push_back(' ');
    else if (c == '`') out.push_back('\'');
    else out.push_back(c);
  }
  return out;
}

static std::string replace_all(std::string s, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
  return s;
}

ResponseCatalog::ResponseCatalog(std::vector<ResponseTemplate> templates, std::string fallback)
  : templates_(std::move(templates)), fallback_(std::move(fallback)) {}

const ResponseTemplate* ResponseCatalog::match(const std::string& query) const {
  // leading space lets a keyword like " pv" match only at a word start
  std::string q = " " + to_lower(query);
  for (const auto& t : templates_) {
    for (const auto& kw : t.keywords) {
      if (q.find(kw) != std::string::npos) return &t;
    }
  }
  return nullptr;
}

RuleBasedGenerator::RuleBasedGenerator(ResponseCatalog catalog) : catalog_(std::move(catalog)) {}

std::string RuleBasedGenerator::generate(const std::string& query) const {
  const ResponseTemplate* t = catalog_.match(query);
  if (!t) return catalog_.fallback();
  return replace_all(t->body, "{query}", sanitize_query(query));
}

std::string RuleBasedGenerator::topic(const std::string& query) const {
  const ResponseTemplate* t = catalog_.match(query);
  return t ? t->name : std::string("fallback");
}

static const char* const kDeploymentDoc = R"DOC(I'll help you create a deployment. Here's an executable document:

# Deploy Application to Kubernetes

Request: {query}

## Prerequisites

- A running Kubernetes cluster
- kubectl installed and pointing at the target cluster context
- Permission to create deployments in the current namespace

## Step 1: Create Deployment

```bash
kubectl create deployment my-app --image=nginx:latest --replicas=3
```

## Step 2: Expose the Deployment

```bash
kubectl expose deployment my-app --port=80 --target-port=80 --type=ClusterIP
```

## Step 3: Verify Deployment

```bash
kubectl get deployments
kubectl get pods -l app=my-app
```

Save this as a .md file and run: ie execute deployment.md)DOC";

static const char* const kServiceDoc = R"DOC(Here's how to create a Kubernetes service:

# Create Kubernetes Service

Request: {query}

## Step 1: Create Service YAML

```bash
cat <<EOF > service.yaml
apiVersion: v1
kind: Service
metadata:
  name: my-service
spec:
  selector:
    app: my-app
  ports:
    - protocol: TCP
      port: 80
      targetPort: 8080
  type: ClusterIP
EOF
```

## Step 2: Apply Service

```bash
kubectl apply -f service.yaml
```

## Step 3: Verify Service

```bash
kubectl get services
kubectl describe service my-service
```

Save this as a .md file and run: ie execute service.md)DOC";

static const char* const kIngressDoc = R"DOC(I'll guide you through setting up an ingress controller:

# Setup Ingress Controller

Request: {query}

## Step 1: Install NGINX Ingress Controller

```bash
kubectl apply -f https://raw.githubusercontent.com/kubernetes/ingress-nginx/controller-v1.8.1/deploy/static/provider/cloud/deploy.yaml
```

## Step 2: Wait for Controller to be Ready

```bash
kubectl wait --namespace ingress-nginx \
  --for=condition=ready pod \
  --selector=app.kubernetes.io/component=controller \
  --timeout=90s
```

## Step 3: Create Ingress Resource

```bash
cat <<EOF > ingress.yaml
apiVersion: networking.k8s.io/v1
kind: Ingress
metadata:
  name: my-ingress
  annotations:
    nginx.ingress.kubernetes.io/rewrite-target: /
spec:
  rules:
  - host: my-app.local
    http:
      paths:
      - path: /
        pathType: Prefix
        backend:
          service:
            name: my-service
            port:
              number: 80
EOF
```

## Step 4: Apply Ingress

```bash
kubectl apply -f ingress.yaml
```

Save this as a .md file and run: ie execute ingress.md)DOC";

static const char* const kPodDoc = R"DOC(Here's an executable document for running and inspecting a pod:

# Work with Pods

Request: {query}

## Step 1: Describe the Pod

```yaml
apiVersion: v1
kind: Pod
metadata:
  name: my-pod
  labels:
    app: my-app
spec:
  containers:
  - name: web
    image: nginx:latest
    ports:
    - containerPort: 80
```

## Step 2: Create the Pod

```bash
cat <<EOF > pod.yaml
apiVersion: v1
kind: Pod
metadata:
  name: my-pod
  labels:
    app: my-app
spec:
  containers:
  - name: web
    image: nginx:latest
    ports:
    - containerPort: 80
EOF
kubectl apply -f pod.yaml
```

## Step 3: Wait and Inspect

```bash
kubectl wait --for=condition=Ready pod/my-pod --timeout=60s
kubectl get pods -o wide
kubectl logs my-pod
```

Save this as a .md file and run: ie execute pod.md)DOC";

static const char* const kStorageDoc = R"DOC(Here's how to give your workloads persistent storage:

# Configure Persistent Storage

Request: {query}

## Step 1: Create a PersistentVolume

```bash
cat <<EOF > pv.yaml
apiVersion: v1
kind: PersistentVolume
metadata:
  name: my-pv
spec:
  capacity:
    storage: 1Gi
  accessModes:
    - ReadWriteOnce
  hostPath:
    path: /mnt/data
EOF
kubectl apply -f pv.yaml
```

## Step 2: Claim the Volume

```bash
cat <<EOF > pvc.yaml
apiVersion: v1
kind: PersistentVolumeClaim
metadata:
  name: my-pvc
spec:
  accessModes:
    - ReadWriteOnce
  resources:
    requests:
      storage: 1Gi
EOF
kubectl apply -f pvc.yaml
```

## Step 3: Verify Binding

```bash
kubectl get pv
kubectl get pvc my-pvc
```

Mount the claim in a pod spec under volumes with persistentVolumeClaim.claimName: my-pvc.

Save this as a .md file and run: ie execute storage.md)DOC";

static const char* const kConfigDoc = R"DOC(Here's how to manage application configuration:

# Manage ConfigMaps and Secrets

Request: {query}

## Step 1: Create a ConfigMap

```bash
kubectl create configmap my-config --from-literal=APP_MODE=production --from-literal=LOG_LEVEL=info
```

## Step 2: Create a Secret

```bash
kubectl create secret generic my-secret --from-literal=DB_PASSWORD=change-me
```

## Step 3: Verify

```bash
kubectl get configmap my-config -o yaml
kubectl get secret my-secret
```

Reference them from a container with envFrom and configMapRef / secretRef.

Save this as a .md file and run: ie execute config.md)DOC";

static const char* const kFallbackDoc = R"DOC(I can help you with Kubernetes tasks! Here are some things I can assist with:

- Deployments: creating and exposing applications
- Services: networking between workloads
- Ingress: setting up ingress controllers
- Pods: running and inspecting containers
- Storage: persistent volumes and claims
- Configuration: ConfigMaps and Secrets

Try asking more specific questions like:
- "How do I create a deployment?"
- "Help me set up a service"
- "I need to configure ingress"

## Quick Start

Use the quick start keys for common tasks:
- F1: deploy an application
- F2: create a service
- F3: set up ingress
- F4: add persistent storage

All responses will be in executable document format that you can save as .md files and run with Innovation Engine!)DOC";

ResponseCatalog ResponseCatalog::defaults() {
  return ResponseCatalog({
    {"deployment", {"deployment", "deploy"}, kDeploymentDoc},
    {"service", {"service"}, kServiceDoc},
    {"ingress", {"ingress"}, kIngressDoc},
    {"pod", {"pod"}, kPodDoc},
    {"storage", {"storage", "volume", "persistentvolume", " pv", "pvc"}, kStorageDoc},
    {"configuration", {"configmap", "config map", "secret"}, kConfigDoc},
  }, kFallbackDoc);
}
